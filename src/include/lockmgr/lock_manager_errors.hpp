#pragma once
/**
 * @file lock_manager_errors.hpp
 * @brief Exceptions raised by lock manager registration and resolution.
 */
#include <stdexcept>
#include <string>

namespace lockhub::lockmgr
{

/// Malformed registration input: missing name/class, unknown class, duplicate name.
class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// A lock manager name that is not registered.
class NotFoundError : public std::out_of_range
{
  public:
    using std::out_of_range::out_of_range;
};

/// A lock manager could not be built: missing or invalid settings, unreachable dependency.
class ConstructionError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace lockhub::lockmgr
