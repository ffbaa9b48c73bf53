#pragma once
/**
 * @file lock_manager_factory.hpp
 * @brief Dispatch table from lock manager kind to constructor.
 */
#include "lockmgr/lock_manager.hpp"
#include "lockmgr/lock_manager_config.hpp"

#include <functional>
#include <map>
#include <memory>

namespace lockhub::lockmgr
{

/// Builds a ready-to-use manager from fully resolved settings; throws ConstructionError.
using LockManagerFactoryFn =
    std::function<std::shared_ptr<LockManager>(const LockManagerSettings &settings)>;

using LockManagerFactoryTable = std::map<LockManagerKind, LockManagerFactoryFn>;

/// Factories for every LockManagerKind: DBLockManager, FSLockManager, MemcLockManager, NullLockManager.
const LockManagerFactoryTable &default_factory_table();

/// Builds a NullLockManager directly (used for the default fallback).
std::shared_ptr<LockManager> make_null_lock_manager(const LockManagerSettings &settings);

} // namespace lockhub::lockmgr
