#include "lockmgr/fs_lock_manager.hpp"
#include "lockmgr/lock_manager_errors.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lockhub::lockmgr
{

uint64_t fnv1a_64(std::string_view data) noexcept
{
    constexpr uint64_t kOffsetBasis = 14695981039346656037ULL;
    constexpr uint64_t kPrime = 1099511628211ULL;
    uint64_t hash = kOffsetBasis;
    for (const char c : data)
    {
        hash ^= static_cast<uint8_t>(c);
        hash *= kPrime;
    }
    return hash;
}

FSLockManager::FSLockManager(const LockManagerSettings &settings) : LockManager(settings)
{
    const auto &params = settings.params;
    if (!params.contains("lockDirectory") || !params.at("lockDirectory").is_string() ||
        params.at("lockDirectory").get<std::string>().empty())
    {
        throw ConstructionError(fmt::format(
            "FSLockManager '{}': 'lockDirectory' setting is required", settings.name));
    }
    m_lock_dir = fs::path(params.at("lockDirectory").get<std::string>());

    std::error_code ec;
    fs::create_directories(m_lock_dir, ec);
    if (ec || !fs::is_directory(m_lock_dir))
    {
        throw ConstructionError(fmt::format("FSLockManager '{}': cannot create lock directory '{}': {}",
                                            settings.name, m_lock_dir.string(),
                                            ec ? ec.message() : "not a directory"));
    }
    logger().debug("FSLockManager '{}' using '{}'", settings.name, m_lock_dir.string());
}

FSLockManager::~FSLockManager()
{
    release_all();
    for (const auto &[path, fd] : m_fds)
    {
        ::close(fd);
    }
}

fs::path FSLockManager::lock_file_for(const std::string &path) const
{
    return m_lock_dir / fmt::format("{:016x}.lock", fnv1a_64(path));
}

LockManager::AcquireResult FSLockManager::try_acquire(const std::string &path, LockType type,
                                                     bool holding_shared)
{
    int fd = -1;
    auto existing = m_fds.find(path);
    if (existing != m_fds.end())
    {
        fd = existing->second;
    }
    else
    {
        const auto file = lock_file_for(path);
        fd = ::open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd == -1)
        {
            const std::error_code ec(errno, std::generic_category());
            return AcquireResult::failed(
                fmt::format("cannot open lock file '{}': {}", file.string(), ec.message()));
        }
    }
    auto fd_guard = basics::make_scope_guard([fd]() { ::close(fd); });
    if (holding_shared)
    {
        // The descriptor belongs to the shared hold.
        fd_guard.dismiss();
    }

    const int op = (type == LockType::Exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB;
    if (::flock(fd, op) != 0)
    {
        const int err = errno;
        if (holding_shared && ::flock(fd, LOCK_SH | LOCK_NB) != 0)
        {
            // A failed conversion can drop the old lock on Linux.
            logger().error("shared lock on '{}' lost after failed upgrade", path);
        }
        if (err == EWOULDBLOCK || err == EINTR)
        {
            return AcquireResult::busy();
        }
        const std::error_code ec(err, std::generic_category());
        return AcquireResult::failed(fmt::format("flock failed: {}", ec.message()));
    }
    fd_guard.dismiss();
    m_fds[path] = fd;
    return AcquireResult::granted();
}

std::optional<std::string> FSLockManager::release(const std::string &path, LockType type,
                                                  bool keep_shared)
{
    auto found = m_fds.find(path);
    if (found == m_fds.end())
    {
        return fmt::format("no lock file open for {} hold", to_string(type));
    }
    const int fd = found->second;
    if (keep_shared)
    {
        // Converting an flock is not atomic; another process may win the file in between.
        if (::flock(fd, LOCK_SH | LOCK_NB) != 0)
        {
            const std::error_code ec(errno, std::generic_category());
            return fmt::format("downgrade to shared failed: {}", ec.message());
        }
        return std::nullopt;
    }
    ::flock(fd, LOCK_UN);
    ::close(fd);
    m_fds.erase(found);
    return std::nullopt;
}

} // namespace lockhub::lockmgr
