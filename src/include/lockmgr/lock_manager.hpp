#pragma once
/**
 * @file lock_manager.hpp
 * @brief Base class for the lock managers that serialize access to storage paths.
 *
 * A lock manager hands out shared and exclusive locks on abstract file paths.
 * The base class keeps per-path reference counts, so the backend is only asked
 * to change state when a path goes from unlocked to locked (or shared to
 * exclusive) and back:
 *
 *  - locking a path twice needs two unlocks;
 *  - a shared request on a path held exclusively is counted, not forwarded;
 *  - an exclusive request on a path held shared is an upgrade;
 *  - releasing the last exclusive hold while shared holds remain is a downgrade.
 *
 * Paths of one request are sorted and de-duplicated before acquisition. If one
 * path fails, the paths acquired by that request are released again.
 *
 * Instances are shared between threads of a process; all public methods are
 * thread-safe. Holds belong to the manager, not to the calling thread.
 * Backends see one non-blocking attempt at a time, made under the manager's
 * mutex. A request waiting for a busy path sleeps between attempts without the
 * mutex, so other callers are not held up by it.
 */
#include "lkh_service.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lockhub::lockmgr
{

class TransactionalConnection;

enum class LockType
{
    Shared,
    Exclusive
};

std::string_view to_string(LockType type) noexcept;

struct PathError
{
    std::string path;
    std::string message;
};

/// Outcome of a lock or unlock request: ok, or one message per failed path.
class LockStatus
{
  public:
    [[nodiscard]] bool ok() const noexcept { return m_errors.empty(); }
    const std::vector<PathError> &errors() const noexcept { return m_errors; }

    void add_error(std::string path, std::string message);
    void merge(const LockStatus &other);

    /// "ok" or "path: message; path: message".
    std::string to_string() const;

  private:
    std::vector<PathError> m_errors;
};

/**
 * @brief Everything a lock manager needs to be built.
 *
 * `params` holds the registered settings (including the injected `domain`).
 * The shared handles are filled by the registry according to the kind.
 */
struct LockManagerSettings
{
    std::string name;
    std::string selector; // as registered, e.g. "PostgreSqlLockManager"
    std::string domain;
    nlohmann::json params = nlohmann::json::object();
    std::shared_ptr<TransactionalConnection> local_db_master; // "dbServers.localDBMaster"
    std::shared_ptr<utils::ObjectCache> srv_cache;            // "srvCache"
    utils::LoggerHandle logger;
};

class LockManager
{
  public:
    explicit LockManager(const LockManagerSettings &settings);
    virtual ~LockManager();

    LockManager(const LockManager &) = delete;
    LockManager &operator=(const LockManager &) = delete;

    /**
     * @brief Locks every path in `paths` with `type`.
     * @param timeout How long to keep retrying contended paths; zero tries once.
     */
    LockStatus lock(const std::vector<std::string> &paths, LockType type,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /// Releases one hold of `type` on every path. Unheld paths are reported as errors.
    LockStatus unlock(const std::vector<std::string> &paths, LockType type);

    /// Current hold count of `type` on `path` by this manager.
    size_t held_count(const std::string &path, LockType type) const;

    const std::string &name() const noexcept { return m_name; }
    const std::string &domain() const noexcept { return m_domain; }

    /// Implementation selector this manager was built for, e.g. "FSLockManager".
    virtual std::string_view kind_name() const noexcept = 0;

  protected:
    /// Result of one backend acquisition attempt.
    struct AcquireResult
    {
        enum class Outcome
        {
            Granted,
            Busy,  ///< Held elsewhere; worth retrying until the deadline.
            Failed ///< Will not succeed by retrying; `error` says why.
        };

        Outcome outcome{Outcome::Granted};
        std::string error;

        static AcquireResult granted() { return {Outcome::Granted, {}}; }
        static AcquireResult busy() { return {Outcome::Busy, {}}; }
        static AcquireResult failed(std::string message) { return {Outcome::Failed, std::move(message)}; }
    };

    /**
     * @brief One non-blocking backend acquisition of `path`.
     * @param holding_shared True when this manager already holds `path` shared
     *        and `type` is Exclusive (an upgrade). A busy upgrade must leave the
     *        shared hold in place.
     */
    virtual AcquireResult try_acquire(const std::string &path, LockType type,
                                      bool holding_shared) = 0;

    /**
     * @brief Backend release of `path` held with `type`.
     * @param keep_shared True when releasing Exclusive while shared holds remain
     *        (a downgrade).
     */
    virtual std::optional<std::string> release(const std::string &path, LockType type,
                                               bool keep_shared) = 0;

    /// Releases every backend hold. Derived destructors call this while still intact.
    void release_all() noexcept;

    const utils::LoggerHandle &logger() const noexcept { return m_logger; }

  private:
    using Deadline = std::chrono::steady_clock::time_point;

    struct Holds
    {
        size_t shared{0};
        size_t exclusive{0};
    };

    /// Polls the backend for `path` until granted, failed or past `deadline`.
    std::optional<std::string> acquire_one(const std::string &path, LockType type,
                                           Deadline deadline);
    /// Drops one `type` hold of `path`, releasing the backend on the last one. Requires m_mutex.
    std::optional<std::string> drop_hold(const std::string &path, Holds &holds, LockType type);

    std::string m_name;
    std::string m_domain;
    utils::LoggerHandle m_logger;
    mutable std::mutex m_mutex;
    std::map<std::string, Holds> m_holds;
};

} // namespace lockhub::lockmgr
