#pragma once
/**
 * @file lock_manager_registry.hpp
 * @brief Domain-scoped registry of named lock managers.
 *
 * The registry is built from registration records for one domain. It never
 * builds anything up front: the first `get(name)` constructs the manager,
 * injecting the shared infrastructure its kind needs, and every later call
 * returns the same instance.
 *
 *  - database kinds receive the domain's auto-committing connection
 *    (`dbServers.localDBMaster`) and the process-local cache (`srvCache`);
 *  - the cache kind receives `srvCache`;
 *  - every kind receives a logger on channel "LockManager".
 *
 * Construction of one name happens at most once even under concurrent
 * `get()` calls: each entry has its own mutex, so building one manager does
 * not block resolution of the others. A failed construction leaves the entry
 * empty and the next call tries again.
 *
 * The config table is immutable after construction. The registry borrows the
 * DependencyProvider, which must outlive it.
 */
#include "lockmgr/dependency_provider.hpp"
#include "lockmgr/lock_manager.hpp"
#include "lockmgr/lock_manager_config.hpp"
#include "lockmgr/lock_manager_factory.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace lockhub::lockmgr
{

enum class DuplicateNamePolicy
{
    Reject,  ///< A second record with the same name is a ConfigError.
    LastWins ///< The later record replaces the earlier one; a warning is logged.
};

struct RegistryOptions
{
    DuplicateNamePolicy duplicates{DuplicateNamePolicy::Reject};
    LockManagerFactoryTable factories{default_factory_table()};
};

class LockManagerRegistry
{
  public:
    static constexpr const char *kLoggerChannel = "LockManager";
    static constexpr const char *kDefaultName = "default";
    static constexpr const char *kFallbackName = "fsLockManager";

    /**
     * @param records JSON array of registration records.
     * @throws ConfigError on any invalid record; no registry is produced.
     */
    LockManagerRegistry(std::string domain, const nlohmann::json &records,
                        DependencyProvider &deps, RegistryOptions options = {});
    ~LockManagerRegistry();

    LockManagerRegistry(const LockManagerRegistry &) = delete;
    LockManagerRegistry &operator=(const LockManagerRegistry &) = delete;

    /**
     * @brief The manager registered as `name`, built on first use.
     * @throws NotFoundError for an unregistered name.
     * @throws ConstructionError (or whatever the dependencies throw) if building fails.
     */
    std::shared_ptr<LockManager> get(const std::string &name);

    /**
     * @brief Registered configuration of `name`: `{"class": selector}` plus its settings.
     * @throws NotFoundError for an unregistered name. Never builds the manager.
     */
    nlohmann::json config(const std::string &name) const;

    /**
     * @brief The "default" manager if registered, otherwise a fresh NullLockManager.
     *
     * Kept for callers that must always get a usable manager; whether any still
     * rely on the no-op fallback needs re-checking before it is removed.
     */
    std::shared_ptr<LockManager> get_default();

    /**
     * @brief The "default" manager if registered, otherwise "fsLockManager".
     * @throws NotFoundError if neither is registered.
     *
     * Kept for callers that need some real lock manager; re-check the call sites
     * before relying on it in new code.
     */
    std::shared_ptr<LockManager> get_any();

    bool has(const std::string &name) const noexcept;
    /// Registered names in registration order.
    std::vector<std::string> names() const;
    const std::string &domain() const noexcept { return m_domain; }
    /// True once `name` has been built; false for unregistered names.
    bool is_instantiated(const std::string &name) const;

  private:
    struct Entry
    {
        explicit Entry(LockManagerConfig cfg) : config(std::move(cfg)) {}

        LockManagerConfig config;
        std::mutex mutex;
        std::shared_ptr<LockManager> instance;
    };

    Entry &entry_or_throw(const std::string &name) const;
    std::shared_ptr<LockManager> build(const LockManagerConfig &config);

    std::string m_domain;
    DependencyProvider &m_deps;
    LockManagerFactoryTable m_factories;
    std::vector<std::string> m_order;
    std::unordered_map<std::string, std::unique_ptr<Entry>> m_entries;
};

} // namespace lockhub::lockmgr
