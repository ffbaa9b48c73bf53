#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Dependency-ordered startup and shutdown of process-wide services.
 *
 * Services (the Logger, for instance) describe themselves with a `ModuleDef`.
 * The `LifecycleManager` starts the registered modules in dependency order and
 * stops them in reverse. An unknown dependency or a dependency cycle is fatal:
 * the manager prints the module table and aborts.
 *
 * Initialization and finalization happen once per process. The usual entry
 * point is a `LifecycleGuard` at the top of `main()`:
 *
 * @code
 *   int main()
 *   {
 *       lockhub::utils::LifecycleGuard app(
 *           lockhub::utils::MakeModDefList(lockhub::utils::Logger::GetLifecycleModule()));
 *       ...
 *   }
 * @endcode
 ******************************************************************************/
#include "lkh_platform.hpp"
#include "lockhub_utils_export.h"
#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace lockhub::utils
{

class LifecycleManagerImpl;

/// @brief Builds a vector<ModuleDef> by moving the supplied ModuleDef args.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class LOCKHUB_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before `initialize()`; registering
     *        afterwards is a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in topological order. Idempotent.
     *        Aborts on a dependency cycle, an unknown dependency or a startup exception.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Stops the started modules in reverse order, each bounded by its
     *        shutdown timeout. Idempotent.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

[[nodiscard]] inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the process lifecycle.
 *
 * The first guard constructed registers its modules and initializes the
 * application; its destructor finalizes. Later guards are no-ops.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            LKH_DEBUG("[LKH_LifeCycle] LifecycleGuard finalizing as owner ({}:{}).",
                      lockhub::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            lockhub::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                lockhub::utils::RegisterModule(std::move(m));
            }
            // Initialize even with no modules so the lifecycle starts with the first guard.
            lockhub::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            LKH_DEBUG("[LKH_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                      "already exists; provided modules were ignored. ({}:{})",
                      lockhub::platform::get_executable_name(), lockhub::platform::get_pid(),
                      lockhub::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace lockhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
