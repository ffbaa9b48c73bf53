#include "lockmgr/memc_lock_manager.hpp"
#include "lockmgr/lock_manager_errors.hpp"

#include <atomic>
#include <charconv>

namespace lockhub::lockmgr
{

namespace
{
std::string make_session_id()
{
    static std::atomic<uint64_t> s_counter{0};
    return fmt::format("{}:{}", lockhub::platform::get_pid(),
                       s_counter.fetch_add(1, std::memory_order_relaxed));
}
} // namespace

MemcLockManager::MemcLockManager(const LockManagerSettings &settings)
    : LockManager(settings), m_cache(settings.srv_cache), m_session(make_session_id())
{
    if (!m_cache)
    {
        throw ConstructionError(
            fmt::format("MemcLockManager '{}': no 'srvCache' cache supplied", settings.name));
    }
    const auto &params = settings.params;
    if (params.contains("lockTTL"))
    {
        const auto &v = params.at("lockTTL");
        if (!v.is_number_integer() || v.get<int64_t>() <= 0)
        {
            throw ConstructionError(fmt::format(
                "MemcLockManager '{}': 'lockTTL' must be a positive integer", settings.name));
        }
        m_lock_ttl = std::chrono::seconds(v.get<int64_t>());
    }
}

MemcLockManager::~MemcLockManager()
{
    release_all();
}

std::string MemcLockManager::exclusive_key(const std::string &path) const
{
    return fmt::format("lock:{}:{}", domain(), path);
}

std::string MemcLockManager::shared_key(const std::string &path) const
{
    return fmt::format("lock:{}:{}:shared", domain(), path);
}

int64_t MemcLockManager::shared_holders(const std::string &path)
{
    const auto value = m_cache->get(shared_key(path));
    if (!value)
    {
        return 0;
    }
    int64_t count = 0;
    const auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), count);
    return ec == std::errc() ? count : 0;
}

void MemcLockManager::drop_exclusive_key(const std::string &path)
{
    const auto key = exclusive_key(path);
    const auto owner = m_cache->get(key);
    if (owner && *owner == m_session)
    {
        m_cache->erase(key);
    }
    else
    {
        logger().warn("exclusive lock on '{}' expired or was taken over before release", path);
    }
}

void MemcLockManager::drop_shared_count(const std::string &path)
{
    if (!m_cache->decr(shared_key(path), 1))
    {
        logger().warn("shared lock count on '{}' expired before release", path);
    }
}

LockManager::AcquireResult MemcLockManager::try_acquire(const std::string &path, LockType type,
                                                       bool holding_shared)
{
    const auto ex_key = exclusive_key(path);
    if (type == LockType::Shared)
    {
        if (m_cache->get(ex_key))
        {
            return AcquireResult::busy();
        }
        const auto sh_key = shared_key(path);
        m_cache->incr(sh_key, 1, m_lock_ttl);
        // An exclusive holder may have slipped in; back off.
        if (m_cache->get(ex_key))
        {
            m_cache->decr(sh_key, 1);
            return AcquireResult::busy();
        }
        m_states[path].shared_counted = true;
        return AcquireResult::granted();
    }

    if (!m_cache->add(ex_key, m_session, m_lock_ttl))
    {
        return AcquireResult::busy();
    }
    if (shared_holders(path) > (holding_shared ? 1 : 0))
    {
        m_cache->erase(ex_key);
        return AcquireResult::busy();
    }
    m_states[path].exclusive = true;
    return AcquireResult::granted();
}

std::optional<std::string> MemcLockManager::release(const std::string &path, LockType type,
                                                    bool keep_shared)
{
    auto found = m_states.find(path);
    if (found == m_states.end())
    {
        return fmt::format("no cache entry held for {} hold", to_string(type));
    }
    PathState &state = found->second;
    if (type == LockType::Exclusive)
    {
        if (keep_shared && !state.shared_counted)
        {
            m_cache->incr(shared_key(path), 1, m_lock_ttl);
            state.shared_counted = true;
        }
        if (state.exclusive)
        {
            drop_exclusive_key(path);
            state.exclusive = false;
        }
        if (!keep_shared && state.shared_counted)
        {
            drop_shared_count(path);
            state.shared_counted = false;
        }
    }
    else if (state.shared_counted)
    {
        drop_shared_count(path);
        state.shared_counted = false;
    }
    if (!state.shared_counted && !state.exclusive)
    {
        m_states.erase(found);
    }
    return std::nullopt;
}

} // namespace lockhub::lockmgr
