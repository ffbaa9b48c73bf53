#pragma once

#include "lockmgr/lock_manager.hpp"

namespace lockhub::lockmgr
{

/// Grants every request without touching any backend. Hold counts are still kept.
class NullLockManager final : public LockManager
{
  public:
    explicit NullLockManager(const LockManagerSettings &settings);
    ~NullLockManager() override;

    std::string_view kind_name() const noexcept override { return "NullLockManager"; }

  protected:
    AcquireResult try_acquire(const std::string &path, LockType type,
                              bool holding_shared) override;
    std::optional<std::string> release(const std::string &path, LockType type,
                                       bool keep_shared) override;
};

} // namespace lockhub::lockmgr
