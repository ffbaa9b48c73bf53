#include "lockmgr/dependency_provider.hpp"
#include "lockmgr/lock_manager_errors.hpp"

namespace lockhub::lockmgr
{

ServiceDependencyProvider::ServiceDependencyProvider(ConnectionSource connections,
                                                     std::shared_ptr<utils::ObjectCache> cache)
    : m_connections(std::move(connections)), m_cache(std::move(cache))
{
    if (!m_cache)
    {
        m_cache = std::make_shared<utils::HashObjectCache>();
    }
}

std::shared_ptr<TransactionalConnection>
ServiceDependencyProvider::get_connection(const std::string &domain)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto it = m_open.find(domain); it != m_open.end())
    {
        return it->second;
    }
    if (!m_connections)
    {
        throw ConstructionError(
            fmt::format("no database connection source configured (domain '{}')", domain));
    }
    auto conn = m_connections(domain);
    if (!conn)
    {
        throw ConstructionError(
            fmt::format("connection source returned no connection for domain '{}'", domain));
    }
    LOGGER_DEBUG("ServiceDependencyProvider: opened lock connection for domain '{}'", domain);
    m_open.emplace(domain, conn);
    return conn;
}

std::shared_ptr<utils::ObjectCache> ServiceDependencyProvider::get_local_cache()
{
    return m_cache;
}

utils::LoggerHandle ServiceDependencyProvider::get_logger(const std::string &channel)
{
    return utils::LoggerHandle(channel);
}

} // namespace lockhub::lockmgr
