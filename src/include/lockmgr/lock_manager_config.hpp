#pragma once
/**
 * @file lock_manager_config.hpp
 * @brief Validated description of one named lock manager.
 *
 * Registration records are JSON objects:
 * @code
 *   { "name": "fsLockManager", "class": "FSLockManager", "lockDirectory": "/var/lock/lh" }
 * @endcode
 * `name` and the selector (`class`, or its alias `kind`) are required; every
 * other key is an implementation setting.
 */
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lockhub::lockmgr
{

/// Closed set of lock manager implementations.
enum class LockManagerKind
{
    Database,
    Filesystem,
    Cache,
    Null
};

std::string_view to_string(LockManagerKind kind) noexcept;

/**
 * @brief Maps a selector to its kind.
 *
 * DBLockManager, MySqlLockManager and PostgreSqlLockManager are database-backed,
 * FSLockManager filesystem-backed, MemcLockManager cache-backed and
 * NullLockManager no-op.
 */
std::optional<LockManagerKind> kind_from_selector(std::string_view selector) noexcept;

/// Kinds built on the domain's `dbServers.localDBMaster` connection.
bool kind_needs_connection(LockManagerKind kind) noexcept;
/// Kinds built on the process-local `srvCache`.
bool kind_needs_cache(LockManagerKind kind) noexcept;

struct LockManagerConfig
{
    std::string name;
    std::string selector; // as registered
    LockManagerKind kind{LockManagerKind::Null};
    std::string domain;
    nlohmann::json settings = nlohmann::json::object(); // record minus selector, plus "domain"
};

/**
 * @brief Validates one registration record and injects `domain`.
 * @throws ConfigError if the record is not an object, `name` or the selector is
 *         missing, empty or not a string, or the selector is unknown.
 */
LockManagerConfig parse_lock_manager_record(const nlohmann::json &record, const std::string &domain);

/// `{"class": selector}` merged with the stored settings.
nlohmann::json merged_config(const LockManagerConfig &config);

} // namespace lockhub::lockmgr
