#include "lockmgr/lock_manager_registry_factory.hpp"
#include "lockmgr/lock_manager_errors.hpp"

namespace lockhub::lockmgr
{

LockManagerRegistryFactory::LockManagerRegistryFactory(std::string default_domain,
                                                       RecordSource records,
                                                       DependencyProvider &deps,
                                                       RegistryOptions options)
    : m_default_domain(std::move(default_domain)), m_records(std::move(records)), m_deps(deps),
      m_options(std::move(options))
{
    if (!m_records)
    {
        throw ConfigError("LockManagerRegistryFactory: no record source supplied");
    }
}

std::shared_ptr<LockManagerRegistry> LockManagerRegistryFactory::get(const std::string &domain)
{
    const std::string &key = domain.empty() ? m_default_domain : domain;
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto it = m_registries.find(key); it != m_registries.end())
    {
        return it->second;
    }
    auto registry = std::make_shared<LockManagerRegistry>(key, m_records(key), m_deps, m_options);
    m_registries.emplace(key, registry);
    return registry;
}

size_t LockManagerRegistryFactory::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registries.size();
}

void LockManagerRegistryFactory::reset_for_testing()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_registries.clear();
}

} // namespace lockhub::lockmgr
