#pragma once

#include "lockmgr/lock_manager.hpp"
#include "lockmgr/transactional_connection.hpp"

#include <map>

namespace lockhub::lockmgr
{

/**
 * @brief Locks paths with advisory locks on the domain's primary database.
 *
 * Requires the `local_db_master` connection and the `srv_cache` cache. The
 * advisory key of a path is `"<domain>:<path>"`.
 *
 * When the connection reports the server unreachable, the manager records
 * that in the cache for `safeDelay` seconds (default 60) under
 * `dblockmanager:downservers:<domain>` and fails requests immediately until the
 * entry expires. Every manager sharing the cache sees the same record.
 */
class DBLockManager final : public LockManager
{
  public:
    static constexpr std::chrono::seconds kDefaultSafeDelay{60};

    /// @throws ConstructionError if the connection or cache is missing, or `safeDelay` is invalid.
    explicit DBLockManager(const LockManagerSettings &settings);
    ~DBLockManager() override;

    std::string_view kind_name() const noexcept override { return m_selector; }

    std::chrono::seconds safe_delay() const noexcept { return m_safe_delay; }
    std::string advisory_key(const std::string &path) const;
    /// True while the server is recorded as down in the cache.
    bool server_marked_down() const;

  protected:
    AcquireResult try_acquire(const std::string &path, LockType type,
                              bool holding_shared) override;
    std::optional<std::string> release(const std::string &path, LockType type,
                                       bool keep_shared) override;

  private:
    struct Modes
    {
        bool shared{false};
        bool exclusive{false};
    };

    std::string down_key() const;
    std::string mark_down(const ConnectionError &e);

    std::shared_ptr<TransactionalConnection> m_conn;
    std::shared_ptr<utils::ObjectCache> m_cache;
    std::chrono::seconds m_safe_delay{kDefaultSafeDelay};
    std::string m_selector{"DBLockManager"};
    std::map<std::string, Modes> m_modes;
};

} // namespace lockhub::lockmgr
