#include "lockmgr/lock_manager_factory.hpp"
#include "lockmgr/db_lock_manager.hpp"
#include "lockmgr/fs_lock_manager.hpp"
#include "lockmgr/memc_lock_manager.hpp"
#include "lockmgr/null_lock_manager.hpp"

namespace lockhub::lockmgr
{

namespace
{
template <typename Manager> std::shared_ptr<LockManager> make_manager(const LockManagerSettings &settings)
{
    return std::make_shared<Manager>(settings);
}
} // namespace

const LockManagerFactoryTable &default_factory_table()
{
    static const LockManagerFactoryTable table{
        {LockManagerKind::Database, &make_manager<DBLockManager>},
        {LockManagerKind::Filesystem, &make_manager<FSLockManager>},
        {LockManagerKind::Cache, &make_manager<MemcLockManager>},
        {LockManagerKind::Null, &make_manager<NullLockManager>},
    };
    return table;
}

std::shared_ptr<LockManager> make_null_lock_manager(const LockManagerSettings &settings)
{
    return make_manager<NullLockManager>(settings);
}

} // namespace lockhub::lockmgr
