#include "lockmgr/lock_manager_registry.hpp"
#include "lockmgr/lock_manager_errors.hpp"

namespace lockhub::lockmgr
{

LockManagerRegistry::LockManagerRegistry(std::string domain, const nlohmann::json &records,
                                         DependencyProvider &deps, RegistryOptions options)
    : m_domain(std::move(domain)), m_deps(deps), m_factories(std::move(options.factories))
{
    if (!records.is_array())
    {
        throw ConfigError(fmt::format(
            "Lock manager config: registrations must be an array (got {})", records.type_name()));
    }
    for (const auto &record : records)
    {
        LockManagerConfig config = parse_lock_manager_record(record, m_domain);
        const std::string name = config.name;
        auto existing = m_entries.find(name);
        if (existing != m_entries.end())
        {
            if (options.duplicates == DuplicateNamePolicy::Reject)
            {
                throw ConfigError(fmt::format(
                    "Lock manager config: duplicate lock manager name '{}' in domain '{}'", name,
                    m_domain));
            }
            LOGGER_WARN("LockManagerRegistry[{}]: '{}' registered twice; the later '{}' record wins",
                        m_domain, name, config.selector);
            existing->second = std::make_unique<Entry>(std::move(config));
            continue;
        }
        m_entries.emplace(name, std::make_unique<Entry>(std::move(config)));
        m_order.push_back(name);
    }
    LOGGER_DEBUG("LockManagerRegistry[{}]: {} lock managers registered", m_domain, m_order.size());
}

LockManagerRegistry::~LockManagerRegistry() = default;

LockManagerRegistry::Entry &LockManagerRegistry::entry_or_throw(const std::string &name) const
{
    auto it = m_entries.find(name);
    if (it == m_entries.end())
    {
        throw NotFoundError(
            fmt::format("No lock manager defined with the name '{}' in domain '{}'", name, m_domain));
    }
    return *it->second;
}

std::shared_ptr<LockManager> LockManagerRegistry::get(const std::string &name)
{
    Entry &entry = entry_or_throw(name);
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (!entry.instance)
    {
        entry.instance = build(entry.config);
    }
    return entry.instance;
}

std::shared_ptr<LockManager> LockManagerRegistry::build(const LockManagerConfig &config)
{
    auto factory = m_factories.find(config.kind);
    if (factory == m_factories.end() || !factory->second)
    {
        throw ConstructionError(fmt::format("No factory for lock manager kind '{}' ('{}')",
                                            to_string(config.kind), config.name));
    }

    LockManagerSettings settings;
    settings.name = config.name;
    settings.selector = config.selector;
    settings.domain = config.domain;
    settings.params = config.settings;
    if (kind_needs_connection(config.kind))
    {
        settings.local_db_master = m_deps.get_connection(config.domain);
    }
    if (kind_needs_cache(config.kind))
    {
        settings.srv_cache = m_deps.get_local_cache();
    }
    settings.logger = m_deps.get_logger(kLoggerChannel);

    auto instance = factory->second(settings);
    if (!instance)
    {
        throw ConstructionError(fmt::format("Factory for '{}' returned no lock manager", config.name));
    }
    LOGGER_INFO("LockManagerRegistry[{}]: constructed '{}' ({})", m_domain, config.name,
                config.selector);
    return instance;
}

nlohmann::json LockManagerRegistry::config(const std::string &name) const
{
    return merged_config(entry_or_throw(name).config);
}

std::shared_ptr<LockManager> LockManagerRegistry::get_default()
{
    if (has(kDefaultName))
    {
        return get(kDefaultName);
    }
    LockManagerSettings settings;
    settings.name = "nullLockManager";
    settings.selector = "NullLockManager";
    settings.domain = m_domain;
    settings.params = nlohmann::json{{"domain", m_domain}};
    settings.logger = m_deps.get_logger(kLoggerChannel);
    return make_null_lock_manager(settings);
}

std::shared_ptr<LockManager> LockManagerRegistry::get_any()
{
    if (has(kDefaultName))
    {
        return get(kDefaultName);
    }
    if (has(kFallbackName))
    {
        return get(kFallbackName);
    }
    throw NotFoundError(fmt::format(
        "No lock manager defined with the name '{}' or '{}' in domain '{}'", kDefaultName,
        kFallbackName, m_domain));
}

bool LockManagerRegistry::has(const std::string &name) const noexcept
{
    return m_entries.find(name) != m_entries.end();
}

std::vector<std::string> LockManagerRegistry::names() const
{
    return m_order;
}

bool LockManagerRegistry::is_instantiated(const std::string &name) const
{
    auto it = m_entries.find(name);
    if (it == m_entries.end())
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->instance != nullptr;
}

} // namespace lockhub::lockmgr
