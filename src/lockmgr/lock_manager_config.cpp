#include "lockmgr/lock_manager_config.hpp"
#include "lockmgr/lock_manager_errors.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

namespace lockhub::lockmgr
{

namespace
{

constexpr std::array<std::pair<std::string_view, LockManagerKind>, 6> kSelectors{{
    {"DBLockManager", LockManagerKind::Database},
    {"MySqlLockManager", LockManagerKind::Database},
    {"PostgreSqlLockManager", LockManagerKind::Database},
    {"FSLockManager", LockManagerKind::Filesystem},
    {"MemcLockManager", LockManagerKind::Cache},
    {"NullLockManager", LockManagerKind::Null},
}};

std::string record_label(const nlohmann::json &record, size_t max_len = 120)
{
    auto text = record.dump();
    if (text.size() > max_len)
    {
        text = text.substr(0, max_len) + "...";
    }
    return text;
}

const nlohmann::json *find_key(const nlohmann::json &record, const char *key)
{
    auto it = record.find(key);
    return it == record.end() ? nullptr : &*it;
}

} // namespace

std::string_view to_string(LockManagerKind kind) noexcept
{
    switch (kind)
    {
    case LockManagerKind::Database:
        return "database";
    case LockManagerKind::Filesystem:
        return "filesystem";
    case LockManagerKind::Cache:
        return "cache";
    case LockManagerKind::Null:
        return "null";
    }
    return "unknown";
}

std::optional<LockManagerKind> kind_from_selector(std::string_view selector) noexcept
{
    for (const auto &[name, kind] : kSelectors)
    {
        if (name == selector)
        {
            return kind;
        }
    }
    return std::nullopt;
}

bool kind_needs_connection(LockManagerKind kind) noexcept
{
    return kind == LockManagerKind::Database;
}

bool kind_needs_cache(LockManagerKind kind) noexcept
{
    return kind == LockManagerKind::Database || kind == LockManagerKind::Cache;
}

LockManagerConfig parse_lock_manager_record(const nlohmann::json &record, const std::string &domain)
{
    if (!record.is_object())
    {
        throw ConfigError(fmt::format("Lock manager config: record must be an object (got {}): {}",
                                      record.type_name(), record_label(record)));
    }

    const nlohmann::json *name = find_key(record, "name");
    if (name == nullptr || !name->is_string() || name->get_ref<const std::string &>().empty())
    {
        throw ConfigError(fmt::format(
            "Lock manager config: 'name' must be a non-empty string: {}", record_label(record)));
    }

    const char *selector_key = "class";
    const nlohmann::json *selector = find_key(record, "class");
    if (selector == nullptr)
    {
        selector_key = "kind";
        selector = find_key(record, "kind");
    }
    if (selector == nullptr || !selector->is_string() ||
        selector->get_ref<const std::string &>().empty())
    {
        throw ConfigError(fmt::format(
            "Lock manager config: '{}' has no 'class' (non-empty string) selector",
            name->get_ref<const std::string &>()));
    }

    const auto &selector_str = selector->get_ref<const std::string &>();
    const auto kind = kind_from_selector(selector_str);
    if (!kind)
    {
        throw ConfigError(fmt::format("Lock manager config: '{}' has unknown class '{}'",
                                      name->get_ref<const std::string &>(), selector_str));
    }

    LockManagerConfig config;
    config.name = name->get<std::string>();
    config.selector = selector_str;
    config.kind = *kind;
    config.domain = domain;
    config.settings = record;
    config.settings.erase(selector_key);
    // With both keys present, "class" wins and "kind" is dropped as well.
    config.settings.erase("kind");
    config.settings["domain"] = domain;
    return config;
}

nlohmann::json merged_config(const LockManagerConfig &config)
{
    nlohmann::json merged = nlohmann::json::object();
    merged["class"] = config.selector;
    for (auto it = config.settings.begin(); it != config.settings.end(); ++it)
    {
        merged[it.key()] = it.value();
    }
    return merged;
}

} // namespace lockhub::lockmgr
