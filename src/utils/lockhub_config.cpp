/**
 * @file lockhub_config.cpp
 * @brief Layered configuration loading.
 */
#include "lkh_service.hpp"
#include "utils/lockhub_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#if defined(LOCKHUB_IS_POSIX)
#include <climits>
#include <unistd.h>
#endif

namespace lockhub::utils
{

namespace fs = std::filesystem;

namespace
{

constexpr const char *kDefaultFileName = "lockhub.default.json";
constexpr const char *kUserFileName = "lockhub.user.json";

fs::path get_binary_dir() noexcept
{
    try
    {
        const auto exe = lockhub::platform::get_executable_name(/*include_path=*/true);
        if (exe != "unknown")
        {
            return fs::path(exe).parent_path();
        }
    }
    catch (const std::exception &e)
    {
        LKH_DEBUG("LockHubConfig: cannot resolve binary dir: {}", e.what());
    }
    return {};
}

/// <bin>/../config (staged layout) or <bin>/config (flat layout).
fs::path discover_config_dir() noexcept
{
    try
    {
        const fs::path bin = get_binary_dir();
        if (bin.empty())
            return {};

        fs::path candidate = bin / ".." / "config";
        if (fs::is_directory(candidate))
            return fs::weakly_canonical(candidate);

        candidate = bin / "config";
        if (fs::is_directory(candidate))
            return fs::weakly_canonical(candidate);
    }
    catch (const fs::filesystem_error &e)
    {
        LKH_DEBUG("LockHubConfig: config dir discovery failed: {}", e.what());
    }
    return {};
}

fs::path resolve_path(const fs::path &config_dir, const std::string &raw)
{
    if (raw.empty())
        return {};
    fs::path p(raw);
    if (p.is_absolute() || config_dir.empty())
        return p.lexically_normal();
    return (config_dir / p).lexically_normal();
}

const nlohmann::json &require_type(const nlohmann::json &j, const char *key, bool is_ok,
                                   const char *expected)
{
    if (!is_ok)
    {
        throw std::runtime_error(fmt::format("LockHub config: '{}' must be {} (got {})", key,
                                             expected, j.at(key).type_name()));
    }
    return j.at(key);
}

} // namespace

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    if (!base.is_object())
        base = nlohmann::json::object();
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("LockHub config: failed to parse '{}': {}", path.string(), e.what()));
    }
}

// ---------------------------------------------------------------------------
// LockHubConfig::Impl
// ---------------------------------------------------------------------------

struct LockHubConfig::Impl
{
    std::string domain{"local"};
    std::string log_level{"info"};
    fs::path log_file;
    nlohmann::json lock_managers = nlohmann::json::array();

    fs::path config_dir;
    std::vector<fs::path> loaded_files;
    nlohmann::json merged = nlohmann::json::object();

    void apply_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw std::runtime_error(
                fmt::format("LockHub config: top level must be an object (got {})", j.type_name()));
        }
        if (j.contains("domain"))
        {
            auto value = require_type(j, "domain", j.at("domain").is_string(), "a string")
                             .get<std::string>();
            if (value.empty())
                throw std::runtime_error("LockHub config: 'domain' must not be empty");
            domain = std::move(value);
        }
        if (j.contains("log_level"))
        {
            log_level = require_type(j, "log_level", j.at("log_level").is_string(), "a string")
                            .get<std::string>();
            // Validates the name; throws std::invalid_argument for unknown levels.
            try
            {
                (void)Logger::level_from_string(log_level);
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(fmt::format("LockHub config: {}", e.what()));
            }
        }
        if (j.contains("log_file"))
        {
            const auto &v = j.at("log_file");
            if (v.is_null())
                log_file.clear();
            else
                log_file = resolve_path(
                    config_dir,
                    require_type(j, "log_file", v.is_string(), "a string or null").get<std::string>());
        }
        if (j.contains("lock_managers"))
        {
            lock_managers =
                require_type(j, "lock_managers", j.at("lock_managers").is_array(), "an array");
        }
        json_merge(merged, j);
    }

    void apply_file(const fs::path &path)
    {
        nlohmann::json j = read_json_file(path);
        if (j.is_null())
        {
            LOGGER_INFO("LockHubConfig: '{}' not found, skipped", path.string());
            return;
        }
        LOGGER_INFO("LockHubConfig: loading '{}'", path.string());
        apply_json(j);
        loaded_files.push_back(path);
    }

    void apply_env()
    {
        if (const char *env = std::getenv("LOCKHUB_DOMAIN"); env != nullptr && *env != '\0')
        {
            apply_json(nlohmann::json{{"domain", env}});
        }
        if (const char *env = std::getenv("LOCKHUB_LOG_LEVEL"); env != nullptr && *env != '\0')
        {
            apply_json(nlohmann::json{{"log_level", env}});
        }
    }
};

// ---------------------------------------------------------------------------
// LockHubConfig public interface
// ---------------------------------------------------------------------------

LockHubConfig::LockHubConfig() : pImpl(std::make_unique<Impl>()) {}
LockHubConfig::~LockHubConfig() = default;
LockHubConfig::LockHubConfig(LockHubConfig &&) noexcept = default;
LockHubConfig &LockHubConfig::operator=(LockHubConfig &&) noexcept = default;

LockHubConfig LockHubConfig::load(const fs::path &config_dir, const fs::path &override_file)
{
    LockHubConfig cfg;
    Impl &impl = *cfg.pImpl;

    fs::path single_file = override_file;
    if (single_file.empty())
    {
        if (const char *env = std::getenv("LOCKHUB_CONFIG_FILE"); env != nullptr && *env != '\0')
        {
            single_file = env;
        }
    }

    if (!single_file.empty())
    {
        impl.config_dir = single_file.parent_path();
        if (!fs::exists(single_file))
        {
            LOGGER_WARN("LockHubConfig: override file '{}' not found, using defaults",
                        single_file.string());
        }
        impl.apply_file(single_file);
    }
    else
    {
        impl.config_dir = config_dir.empty() ? discover_config_dir() : config_dir;
        if (impl.config_dir.empty())
        {
            LOGGER_INFO("LockHubConfig: no config directory found, using built-in defaults");
        }
        else
        {
            impl.apply_file(impl.config_dir / kDefaultFileName);
            impl.apply_file(impl.config_dir / kUserFileName);
        }
    }

    impl.apply_env();

    LOGGER_INFO("LockHubConfig: domain        = {}", impl.domain);
    LOGGER_INFO("LockHubConfig: log_level     = {}", impl.log_level);
    LOGGER_INFO("LockHubConfig: lock_managers = {}", impl.lock_managers.size());
    return cfg;
}

void LockHubConfig::apply_json(const nlohmann::json &j)
{
    pImpl->apply_json(j);
}

const std::string &LockHubConfig::domain() const noexcept
{
    return pImpl->domain;
}

const std::string &LockHubConfig::log_level() const noexcept
{
    return pImpl->log_level;
}

const fs::path &LockHubConfig::log_file() const noexcept
{
    return pImpl->log_file;
}

const nlohmann::json &LockHubConfig::lock_managers() const noexcept
{
    return pImpl->lock_managers;
}

const fs::path &LockHubConfig::config_dir() const noexcept
{
    return pImpl->config_dir;
}

const std::vector<fs::path> &LockHubConfig::loaded_files() const noexcept
{
    return pImpl->loaded_files;
}

const nlohmann::json &LockHubConfig::merged_json() const noexcept
{
    return pImpl->merged;
}

} // namespace lockhub::utils
