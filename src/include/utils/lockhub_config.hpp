#pragma once
/**
 * @file lockhub_config.hpp
 * @brief Layered JSON configuration for lockhub processes.
 *
 * Loading strategy (priority low to high):
 *  1. Built-in defaults (domain "local", log level "info", console logging,
 *     no lock managers).
 *  2. lockhub.default.json in the config directory.
 *  3. lockhub.user.json, merged on top of the defaults file.
 *  4. LOCKHUB_CONFIG_FILE (or an explicit override path): replaces both file
 *     layers with a single file.
 *  5. LOCKHUB_DOMAIN / LOCKHUB_LOG_LEVEL environment overrides.
 *
 * Recognised keys:
 * @code
 *   {
 *     "domain": "wiki-en",
 *     "log_level": "debug",
 *     "log_file": "logs/lockhub.log",        // relative to the config dir
 *     "lock_managers": [ { "name": "fsLockManager", "class": "FSLockManager",
 *                          "lockDirectory": "/var/lock/lockhub" } ]
 *   }
 * @endcode
 */
#include "lockhub_utils_export.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockhub::utils
{

class LOCKHUB_UTILS_EXPORT LockHubConfig
{
  public:
    /// Built-in defaults only.
    LockHubConfig();
    ~LockHubConfig();

    LockHubConfig(LockHubConfig &&) noexcept;
    LockHubConfig &operator=(LockHubConfig &&) noexcept;
    LockHubConfig(const LockHubConfig &) = delete;
    LockHubConfig &operator=(const LockHubConfig &) = delete;

    /**
     * @brief Runs the layered load.
     *
     * @param config_dir    Directory holding lockhub.default.json / lockhub.user.json.
     *                      Empty means discover it next to the executable
     *                      (`<bin>/../config` or `<bin>/config`).
     * @param override_file Explicit single file; takes precedence over LOCKHUB_CONFIG_FILE.
     * @throws std::runtime_error if a present file is not valid JSON or a key has
     *         the wrong type. Missing files are skipped.
     */
    static LockHubConfig load(const std::filesystem::path &config_dir = {},
                              const std::filesystem::path &override_file = {});

    /// Applies one JSON object on top of the current values (same validation as load()).
    void apply_json(const nlohmann::json &j);

    const std::string &domain() const noexcept;
    const std::string &log_level() const noexcept;
    /// Absolute log file path; empty means console.
    const std::filesystem::path &log_file() const noexcept;
    /// Array of lock manager records, as given.
    const nlohmann::json &lock_managers() const noexcept;

    const std::filesystem::path &config_dir() const noexcept;
    /// Files that contributed, in load order.
    const std::vector<std::filesystem::path> &loaded_files() const noexcept;
    /// The fully merged JSON (after environment overrides).
    const nlohmann::json &merged_json() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
LOCKHUB_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

/**
 * @brief Reads a JSON file.
 * @return A null JSON value if the file does not exist or cannot be opened.
 * @throws std::runtime_error if the file exists but does not parse.
 */
LOCKHUB_UTILS_EXPORT nlohmann::json read_json_file(const std::filesystem::path &path);

} // namespace lockhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
