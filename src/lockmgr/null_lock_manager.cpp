#include "lockmgr/null_lock_manager.hpp"

namespace lockhub::lockmgr
{

NullLockManager::NullLockManager(const LockManagerSettings &settings) : LockManager(settings) {}

NullLockManager::~NullLockManager()
{
    release_all();
}

LockManager::AcquireResult NullLockManager::try_acquire(const std::string & /*path*/,
                                                       LockType /*type*/,
                                                       bool /*holding_shared*/)
{
    return AcquireResult::granted();
}

std::optional<std::string> NullLockManager::release(const std::string & /*path*/,
                                                    LockType /*type*/, bool /*keep_shared*/)
{
    return std::nullopt;
}

} // namespace lockhub::lockmgr
