#include "utils/object_cache.hpp"

#include <algorithm>
#include <charconv>

namespace lockhub::utils
{

HashObjectCache::HashObjectCache(ClockFn clock) : m_clock(std::move(clock))
{
    if (!m_clock)
    {
        m_clock = [] { return Clock::now(); };
    }
}

HashObjectCache::~HashObjectCache() = default;

HashObjectCache::Entry *HashObjectCache::find_live(std::string_view key, Clock::time_point now)
{
    auto it = m_entries.find(std::string(key));
    if (it == m_entries.end())
    {
        return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= now)
    {
        m_entries.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<HashObjectCache::Clock::time_point> HashObjectCache::expiry_for(Ttl ttl,
                                                                              Clock::time_point now) const
{
    if (ttl <= Ttl::zero())
    {
        return std::nullopt;
    }
    return now + ttl;
}

std::optional<std::string> HashObjectCache::get(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (const Entry *entry = find_live(key, m_clock()))
    {
        return entry->value;
    }
    return std::nullopt;
}

void HashObjectCache::set(std::string_view key, std::string value, Ttl ttl)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.insert_or_assign(std::string(key), Entry{std::move(value), expiry_for(ttl, m_clock())});
}

bool HashObjectCache::add(std::string_view key, std::string value, Ttl ttl)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();
    if (find_live(key, now) != nullptr)
    {
        return false;
    }
    m_entries.insert_or_assign(std::string(key), Entry{std::move(value), expiry_for(ttl, now)});
    return true;
}

bool HashObjectCache::erase(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (find_live(key, m_clock()) == nullptr)
    {
        return false;
    }
    m_entries.erase(std::string(key));
    return true;
}

std::optional<int64_t> HashObjectCache::parse_integer(const std::string &text) noexcept
{
    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

int64_t HashObjectCache::incr(std::string_view key, int64_t delta, Ttl ttl)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();
    Entry *entry = find_live(key, now);
    if (entry == nullptr)
    {
        m_entries.insert_or_assign(std::string(key), Entry{std::to_string(delta), expiry_for(ttl, now)});
        return delta;
    }
    const int64_t current = parse_integer(entry->value).value_or(0) + delta;
    entry->value = std::to_string(current);
    if (ttl > Ttl::zero())
    {
        entry->expires_at = now + ttl;
    }
    return current;
}

std::optional<int64_t> HashObjectCache::decr(std::string_view key, int64_t delta)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry *entry = find_live(key, m_clock());
    if (entry == nullptr)
    {
        return std::nullopt;
    }
    const auto current = parse_integer(entry->value);
    if (!current)
    {
        return std::nullopt;
    }
    const int64_t next = std::max<int64_t>(*current - delta, 0);
    entry->value = std::to_string(next);
    return next;
}

size_t HashObjectCache::size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();
    std::erase_if(m_entries,
                  [now](const auto &item)
                  { return item.second.expires_at && *item.second.expires_at <= now; });
    return m_entries.size();
}

void HashObjectCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

} // namespace lockhub::utils
