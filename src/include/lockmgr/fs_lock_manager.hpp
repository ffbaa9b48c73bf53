#pragma once

#include "lockmgr/lock_manager.hpp"

#include <filesystem>
#include <map>

namespace lockhub::lockmgr
{

/**
 * @brief Locks paths with POSIX `flock` on one lock file per path.
 *
 * Settings: `lockDirectory` (required, created if missing). The lock file for a
 * path is `<lockDirectory>/<fnv1a64(path) as 16 hex digits>.lock`. Lock files
 * are never removed; unlinking races with other processes opening them.
 */
class FSLockManager final : public LockManager
{
  public:
    /// @throws ConstructionError if `lockDirectory` is missing or cannot be created.
    explicit FSLockManager(const LockManagerSettings &settings);
    ~FSLockManager() override;

    std::string_view kind_name() const noexcept override { return "FSLockManager"; }

    const std::filesystem::path &lock_directory() const noexcept { return m_lock_dir; }

    /// Lock file used for `path`.
    std::filesystem::path lock_file_for(const std::string &path) const;

  protected:
    AcquireResult try_acquire(const std::string &path, LockType type,
                              bool holding_shared) override;
    std::optional<std::string> release(const std::string &path, LockType type,
                                       bool keep_shared) override;

  private:
    std::filesystem::path m_lock_dir;
    std::map<std::string, int> m_fds; // path -> open lock file descriptor
};

/// 64-bit FNV-1a hash.
uint64_t fnv1a_64(std::string_view data) noexcept;

} // namespace lockhub::lockmgr
