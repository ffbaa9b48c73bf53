#include "lockmgr/db_lock_manager.hpp"
#include "lockmgr/lock_manager_errors.hpp"

namespace lockhub::lockmgr
{

DBLockManager::DBLockManager(const LockManagerSettings &settings)
    : LockManager(settings), m_conn(settings.local_db_master), m_cache(settings.srv_cache)
{
    if (!m_conn)
    {
        throw ConstructionError(fmt::format(
            "DBLockManager '{}': no 'dbServers.localDBMaster' connection supplied", settings.name));
    }
    if (!m_cache)
    {
        throw ConstructionError(
            fmt::format("DBLockManager '{}': no 'srvCache' cache supplied", settings.name));
    }
    const auto &params = settings.params;
    if (params.contains("safeDelay"))
    {
        const auto &v = params.at("safeDelay");
        if (!v.is_number_integer() || v.get<int64_t>() < 0)
        {
            throw ConstructionError(fmt::format(
                "DBLockManager '{}': 'safeDelay' must be a non-negative integer", settings.name));
        }
        m_safe_delay = std::chrono::seconds(v.get<int64_t>());
    }
    if (!settings.selector.empty())
    {
        m_selector = settings.selector;
    }
}

DBLockManager::~DBLockManager()
{
    release_all();
}

std::string DBLockManager::advisory_key(const std::string &path) const
{
    return fmt::format("{}:{}", domain(), path);
}

std::string DBLockManager::down_key() const
{
    return fmt::format("dblockmanager:downservers:{}", domain());
}

bool DBLockManager::server_marked_down() const
{
    return m_cache->get(down_key()).has_value();
}

std::string DBLockManager::mark_down(const ConnectionError &e)
{
    if (m_safe_delay > std::chrono::seconds::zero())
    {
        m_cache->set(down_key(), "1", m_safe_delay);
    }
    logger().warn("lock database for domain '{}' unreachable, skipping it for {}s: {}", domain(),
                  m_safe_delay.count(), e.what());
    return fmt::format("lock database unreachable: {}", e.what());
}

LockManager::AcquireResult DBLockManager::try_acquire(const std::string &path, LockType type,
                                                     bool /*holding_shared*/)
{
    if (server_marked_down())
    {
        return AcquireResult::failed(
            fmt::format("lock database for domain '{}' is marked down", domain()));
    }
    const bool exclusive = type == LockType::Exclusive;
    try
    {
        if (!m_conn->try_advisory_lock(advisory_key(path), exclusive))
        {
            return AcquireResult::busy();
        }
    }
    catch (const ConnectionError &e)
    {
        return AcquireResult::failed(mark_down(e));
    }
    Modes &modes = m_modes[path];
    (exclusive ? modes.exclusive : modes.shared) = true;
    return AcquireResult::granted();
}

std::optional<std::string> DBLockManager::release(const std::string &path, LockType type,
                                                  bool keep_shared)
{
    auto found = m_modes.find(path);
    if (found == m_modes.end())
    {
        return fmt::format("no advisory lock held for {} hold", to_string(type));
    }
    Modes &modes = found->second;
    const std::string key = advisory_key(path);
    try
    {
        if (type == LockType::Exclusive)
        {
            if (keep_shared && !modes.shared)
            {
                if (!m_conn->try_advisory_lock(key, false))
                {
                    return std::string("downgrade to shared was refused");
                }
                modes.shared = true;
            }
            if (modes.exclusive)
            {
                m_conn->release_advisory_lock(key, true);
                modes.exclusive = false;
            }
            if (!keep_shared && modes.shared)
            {
                m_conn->release_advisory_lock(key, false);
                modes.shared = false;
            }
        }
        else if (modes.shared)
        {
            m_conn->release_advisory_lock(key, false);
            modes.shared = false;
        }
    }
    catch (const ConnectionError &e)
    {
        // The session is gone, and its advisory locks with it.
        m_modes.erase(found);
        return mark_down(e);
    }
    if (!modes.shared && !modes.exclusive)
    {
        m_modes.erase(found);
    }
    return std::nullopt;
}

} // namespace lockhub::lockmgr
