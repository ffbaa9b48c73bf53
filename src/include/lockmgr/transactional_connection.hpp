#pragma once
/**
 * @file transactional_connection.hpp
 * @brief Database handle used by database-backed lock managers.
 */
#include <stdexcept>
#include <string>

namespace lockhub::lockmgr
{

/// The database server could not be reached or dropped the session.
class ConnectionError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A session on the domain's primary database, in auto-commit mode,
 *        reserved for lock bookkeeping.
 *
 * Advisory locks are owned by the session. Both calls throw `ConnectionError`
 * when the server is unreachable.
 */
class TransactionalConnection
{
  public:
    virtual ~TransactionalConnection() = default;

    /// Domain the session was opened for.
    virtual const std::string &domain() const = 0;

    /// Non-blocking; true if the advisory lock on `key` was granted.
    virtual bool try_advisory_lock(const std::string &key, bool exclusive) = 0;

    virtual void release_advisory_lock(const std::string &key, bool exclusive) = 0;
};

} // namespace lockhub::lockmgr
