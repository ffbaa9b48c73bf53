#pragma once
/**
 * @file lkh_service.hpp
 * @brief Layer 2: Service modules built on lkh_base.
 *
 * Provides lifecycle management, logging, the process-local object cache and
 * the layered JSON configuration.
 */
#include "lkh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/logger_handle.hpp"
#include "utils/object_cache.hpp"
#include "utils/lockhub_config.hpp"
