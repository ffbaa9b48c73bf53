#pragma once
/**
 * @file lock_manager_registry_factory.hpp
 * @brief One LockManagerRegistry per domain, owned by the composition root.
 */
#include "lockmgr/lock_manager_registry.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace lockhub::lockmgr
{

class LockManagerRegistryFactory
{
  public:
    /// Registration records for a domain (a JSON array).
    using RecordSource = std::function<nlohmann::json(const std::string &domain)>;

    /**
     * @param default_domain Domain used by `get()` with an empty name.
     * @param records        Called once per domain, on the first `get()` for it.
     * @param deps           Borrowed; must outlive the factory and every registry it returns.
     */
    LockManagerRegistryFactory(std::string default_domain, RecordSource records,
                               DependencyProvider &deps, RegistryOptions options = {});

    LockManagerRegistryFactory(const LockManagerRegistryFactory &) = delete;
    LockManagerRegistryFactory &operator=(const LockManagerRegistryFactory &) = delete;

    /**
     * @brief The registry for `domain` (the default domain if empty), created on first use.
     * @throws ConfigError if the domain's records are invalid; nothing is cached then.
     */
    std::shared_ptr<LockManagerRegistry> get(const std::string &domain = {});

    const std::string &default_domain() const noexcept { return m_default_domain; }
    size_t size() const;

    /// Drops every cached registry. Registries already handed out stay valid.
    void reset_for_testing();

  private:
    std::string m_default_domain;
    RecordSource m_records;
    DependencyProvider &m_deps;
    RegistryOptions m_options;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<LockManagerRegistry>> m_registries;
};

} // namespace lockhub::lockmgr
