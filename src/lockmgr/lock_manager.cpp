#include "lockmgr/lock_manager.hpp"

#include <algorithm>
#include <thread>

#include <fmt/format.h>

namespace lockhub::lockmgr
{

std::string_view to_string(LockType type) noexcept
{
    return type == LockType::Exclusive ? "exclusive" : "shared";
}

void LockStatus::add_error(std::string path, std::string message)
{
    m_errors.push_back(PathError{std::move(path), std::move(message)});
}

void LockStatus::merge(const LockStatus &other)
{
    m_errors.insert(m_errors.end(), other.m_errors.begin(), other.m_errors.end());
}

std::string LockStatus::to_string() const
{
    if (ok())
    {
        return "ok";
    }
    std::string out;
    for (const auto &err : m_errors)
    {
        if (!out.empty())
        {
            out += "; ";
        }
        out += fmt::format("{}: {}", err.path, err.message);
    }
    return out;
}

LockManager::LockManager(const LockManagerSettings &settings)
    : m_name(settings.name), m_domain(settings.domain), m_logger(settings.logger)
{
}

LockManager::~LockManager()
{
    if (!m_holds.empty())
    {
        LKH_DEBUG("LockManager '{}' destroyed with {} paths still held", m_name, m_holds.size());
    }
}

LockStatus LockManager::lock(const std::vector<std::string> &paths, LockType type,
                             std::chrono::milliseconds timeout)
{
    std::vector<std::string> sorted(paths);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    LockStatus status;
    std::vector<std::string> acquired;
    for (const auto &path : sorted)
    {
        if (auto err = acquire_one(path, type, deadline))
        {
            status.add_error(path, std::move(*err));
            break;
        }
        acquired.push_back(path);
    }

    if (!status.ok())
    {
        m_logger.warn("{} lock failed: {}", to_string(type), status.to_string());
        // Undo this request only; earlier holds are untouched.
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = acquired.rbegin(); it != acquired.rend(); ++it)
        {
            auto found = m_holds.find(*it);
            if (found == m_holds.end())
            {
                continue;
            }
            Holds &holds = found->second;
            // Another caller may have unlocked it while this request was waiting.
            if ((type == LockType::Shared ? holds.shared : holds.exclusive) > 0)
            {
                if (auto err = drop_hold(*it, holds, type))
                {
                    m_logger.error("rollback of '{}' failed: {}", *it, *err);
                }
            }
            if (holds.shared == 0 && holds.exclusive == 0)
            {
                m_holds.erase(found);
            }
        }
    }
    return status;
}

std::optional<std::string> LockManager::acquire_one(const std::string &path, LockType type,
                                                    Deadline deadline)
{
    constexpr std::chrono::milliseconds kRetryInterval(25);
    while (true)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto found = m_holds.find(path);
            const Holds current = found != m_holds.end() ? found->second : Holds{};
            const bool covered = type == LockType::Shared
                                     ? (current.shared > 0 || current.exclusive > 0)
                                     : current.exclusive > 0;
            AcquireResult result = covered ? AcquireResult::granted()
                                           : try_acquire(path, type, current.shared > 0);
            if (result.outcome == AcquireResult::Outcome::Failed)
            {
                return std::move(result.error);
            }
            if (result.outcome == AcquireResult::Outcome::Granted)
            {
                Holds &holds = m_holds[path];
                ++(type == LockType::Shared ? holds.shared : holds.exclusive);
                return std::nullopt;
            }
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            return fmt::format("timed out waiting for {} lock", to_string(type));
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kRetryInterval, deadline - now));
    }
}

std::optional<std::string> LockManager::drop_hold(const std::string &path, Holds &holds,
                                                  LockType type)
{
    size_t &count = type == LockType::Shared ? holds.shared : holds.exclusive;
    if (--count != 0)
    {
        return std::nullopt;
    }
    // A shared hold under an exclusive one never reached the backend.
    const bool backend_holds = type == LockType::Exclusive || holds.exclusive == 0;
    if (!backend_holds)
    {
        return std::nullopt;
    }
    return release(path, type, type == LockType::Exclusive && holds.shared > 0);
}

LockStatus LockManager::unlock(const std::vector<std::string> &paths, LockType type)
{
    std::vector<std::string> sorted(paths);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    LockStatus status;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it)
    {
        const std::string &path = *it;
        auto found = m_holds.find(path);
        if (found == m_holds.end() ||
            (type == LockType::Shared ? found->second.shared : found->second.exclusive) == 0)
        {
            status.add_error(path, fmt::format("path is not locked {}", to_string(type)));
            continue;
        }
        Holds &holds = found->second;
        if (auto err = drop_hold(path, holds, type))
        {
            status.add_error(path, std::move(*err));
        }
        if (holds.shared == 0 && holds.exclusive == 0)
        {
            m_holds.erase(found);
        }
    }
    if (!status.ok())
    {
        m_logger.warn("{} unlock failed: {}", to_string(type), status.to_string());
    }
    return status;
}

size_t LockManager::held_count(const std::string &path, LockType type) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = m_holds.find(path);
    if (found == m_holds.end())
    {
        return 0;
    }
    return type == LockType::Shared ? found->second.shared : found->second.exclusive;
}

void LockManager::release_all() noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto &[path, holds] : m_holds)
    {
        try
        {
            const LockType held = holds.exclusive > 0 ? LockType::Exclusive : LockType::Shared;
            if (auto err = release(path, held, false))
            {
                m_logger.warn("release of '{}' at shutdown failed: {}", path, *err);
            }
        }
        catch (const std::exception &e)
        {
            m_logger.error("release of '{}' at shutdown threw: {}", path, e.what());
        }
    }
    m_holds.clear();
}

} // namespace lockhub::lockmgr
