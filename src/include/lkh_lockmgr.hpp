#pragma once
/**
 * @file lkh_lockmgr.hpp
 * @brief Layer 3: lock managers and their domain-scoped registry.
 */
#include "lkh_service.hpp"

#include "lockmgr/lock_manager_errors.hpp"
#include "lockmgr/transactional_connection.hpp"
#include "lockmgr/lock_manager.hpp"
#include "lockmgr/null_lock_manager.hpp"
#include "lockmgr/fs_lock_manager.hpp"
#include "lockmgr/db_lock_manager.hpp"
#include "lockmgr/memc_lock_manager.hpp"
#include "lockmgr/lock_manager_config.hpp"
#include "lockmgr/lock_manager_factory.hpp"
#include "lockmgr/dependency_provider.hpp"
#include "lockmgr/lock_manager_registry.hpp"
#include "lockmgr/lock_manager_registry_factory.hpp"
