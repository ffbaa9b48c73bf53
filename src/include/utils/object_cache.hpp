#pragma once
/**
 * @file object_cache.hpp
 * @brief Process-local key/value cache used for lock bookkeeping.
 *
 * `ObjectCache` is the interface lock managers depend on: a string-keyed,
 * string-valued store with per-entry expiry and the two atomic primitives
 * cache-backed locking needs (`add` and `incr`/`decr`). `HashObjectCache` is the
 * in-process implementation.
 */
#include "lockhub_utils_export.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockhub::utils
{

class LOCKHUB_UTILS_EXPORT ObjectCache
{
  public:
    /// Zero means "never expires".
    using Ttl = std::chrono::seconds;

    virtual ~ObjectCache() = default;

    virtual std::optional<std::string> get(std::string_view key) = 0;
    virtual void set(std::string_view key, std::string value, Ttl ttl = Ttl::zero()) = 0;

    /// Stores `value` only if `key` is absent or expired. Returns true if stored.
    virtual bool add(std::string_view key, std::string value, Ttl ttl = Ttl::zero()) = 0;

    /// Returns true if an unexpired entry was removed.
    virtual bool erase(std::string_view key) = 0;

    /**
     * @brief Atomically adds `delta` to an integer entry and returns the new value.
     *
     * A missing or expired key counts as 0. A non-integer value is replaced. A
     * non-zero `ttl` becomes the entry's expiry on every call; zero leaves the
     * current expiry alone.
     */
    virtual int64_t incr(std::string_view key, int64_t delta, Ttl ttl = Ttl::zero()) = 0;

    /**
     * @brief Atomically subtracts `delta` from an existing integer entry, stopping at 0.
     *
     * Never creates an entry: a missing, expired or non-integer key returns
     * nullopt and is left as it is. The expiry is kept.
     */
    virtual std::optional<int64_t> decr(std::string_view key, int64_t delta) = 0;
};

class LOCKHUB_UTILS_EXPORT HashObjectCache : public ObjectCache
{
  public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /// @param clock Time source for expiry; defaults to `steady_clock::now`.
    explicit HashObjectCache(ClockFn clock = {});
    ~HashObjectCache() override;

    HashObjectCache(const HashObjectCache &) = delete;
    HashObjectCache &operator=(const HashObjectCache &) = delete;

    std::optional<std::string> get(std::string_view key) override;
    void set(std::string_view key, std::string value, Ttl ttl = Ttl::zero()) override;
    bool add(std::string_view key, std::string value, Ttl ttl = Ttl::zero()) override;
    bool erase(std::string_view key) override;
    int64_t incr(std::string_view key, int64_t delta, Ttl ttl = Ttl::zero()) override;
    std::optional<int64_t> decr(std::string_view key, int64_t delta) override;

    /// Number of unexpired entries.
    size_t size();
    void clear();

  private:
    struct Entry
    {
        std::string value;
        std::optional<Clock::time_point> expires_at;
    };

    // Requires m_mutex.
    Entry *find_live(std::string_view key, Clock::time_point now);
    std::optional<Clock::time_point> expiry_for(Ttl ttl, Clock::time_point now) const;
    static std::optional<int64_t> parse_integer(const std::string &text) noexcept;

    ClockFn m_clock;
    std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace lockhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
