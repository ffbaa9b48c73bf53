#pragma once

#include "lockmgr/lock_manager.hpp"

#include <map>

namespace lockhub::lockmgr
{

/**
 * @brief Locks paths with entries in the shared object cache.
 *
 * An exclusive hold is the key `lock:<domain>:<path>` created with an atomic
 * `add` and holding this manager's session id. Shared holders are counted
 * under `lock:<domain>:<path>:shared`. Both entries expire after `lockTTL`
 * seconds (default 120), so a crashed holder cannot wedge a path forever.
 * Every new shared holder pushes the counter's expiry out again; releases
 * decrement it without ever recreating an expired counter.
 *
 * Exclusion only reaches as far as the injected `srvCache`. The default
 * HashObjectCache lives inside one process, so coordinating several processes
 * or hosts requires an ObjectCache backed by a shared server.
 */
class MemcLockManager final : public LockManager
{
  public:
    static constexpr std::chrono::seconds kDefaultLockTtl{120};

    /// @throws ConstructionError if the cache is missing or `lockTTL` is invalid.
    explicit MemcLockManager(const LockManagerSettings &settings);
    ~MemcLockManager() override;

    std::string_view kind_name() const noexcept override { return "MemcLockManager"; }

    std::chrono::seconds lock_ttl() const noexcept { return m_lock_ttl; }
    const std::string &session() const noexcept { return m_session; }
    std::string exclusive_key(const std::string &path) const;
    std::string shared_key(const std::string &path) const;

  protected:
    AcquireResult try_acquire(const std::string &path, LockType type,
                              bool holding_shared) override;
    std::optional<std::string> release(const std::string &path, LockType type,
                                       bool keep_shared) override;

  private:
    struct PathState
    {
        bool shared_counted{false};
        bool exclusive{false};
    };

    int64_t shared_holders(const std::string &path);
    void drop_exclusive_key(const std::string &path);
    void drop_shared_count(const std::string &path);

    std::shared_ptr<utils::ObjectCache> m_cache;
    std::chrono::seconds m_lock_ttl{kDefaultLockTtl};
    std::string m_session;
    std::map<std::string, PathState> m_states;
};

} // namespace lockhub::lockmgr
