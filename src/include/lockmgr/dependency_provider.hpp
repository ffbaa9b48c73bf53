#pragma once
/**
 * @file dependency_provider.hpp
 * @brief Shared infrastructure handed to lock managers at construction.
 */
#include "lkh_service.hpp"
#include "lockmgr/transactional_connection.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lockhub::lockmgr
{

class DependencyProvider
{
  public:
    virtual ~DependencyProvider() = default;

    /// Auto-committing session on the domain's primary database. May throw.
    virtual std::shared_ptr<TransactionalConnection> get_connection(const std::string &domain) = 0;

    /// The process-local cache.
    virtual std::shared_ptr<utils::ObjectCache> get_local_cache() = 0;

    virtual utils::LoggerHandle get_logger(const std::string &channel) = 0;
};

/**
 * @brief DependencyProvider over a connection source and a cache.
 *
 * Opens at most one connection per domain and hands the same one to every
 * caller. A failed open is not remembered.
 */
class ServiceDependencyProvider : public DependencyProvider
{
  public:
    using ConnectionSource =
        std::function<std::shared_ptr<TransactionalConnection>(const std::string &domain)>;

    /**
     * @param connections Opens sessions; empty means database-backed managers cannot be built.
     * @param cache       Process-local cache; null means a fresh HashObjectCache.
     */
    explicit ServiceDependencyProvider(ConnectionSource connections = {},
                                       std::shared_ptr<utils::ObjectCache> cache = nullptr);

    /// @throws ConstructionError if no connection source is configured or it returns null.
    std::shared_ptr<TransactionalConnection> get_connection(const std::string &domain) override;
    std::shared_ptr<utils::ObjectCache> get_local_cache() override;
    utils::LoggerHandle get_logger(const std::string &channel) override;

  private:
    ConnectionSource m_connections;
    std::shared_ptr<utils::ObjectCache> m_cache;
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<TransactionalConnection>> m_open;
};

} // namespace lockhub::lockmgr
