/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * `initialize()` builds a graph from the registered modules, orders it with
 * Kahn's algorithm and runs each startup callback. Any failure at this stage
 * is fatal. `finalize()` runs the shutdown callbacks in reverse order; each one
 * runs on its own thread with a real deadline (thread+flag+poll+detach, not
 * std::async, whose destructor blocks after a timed-out wait).
 ******************************************************************************/
#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/ranges.h>

namespace
{
constexpr size_t kDebugInfoReserveBytes = 1024;

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > lockhub::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(lockhub::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

void validate_callback_arg(std::string_view arg)
{
    if (arg.size() > lockhub::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error("Lifecycle: callback argument exceeds maximum length.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/// Runs `func` with a deadline; a hung callback is detached and reported as timed out.
ShutdownOutcome timedShutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    auto completed = std::make_shared<std::atomic<bool>>(false);
    auto ex_ptr = std::make_shared<std::exception_ptr>();
    std::thread thread(
        [func, completed, ex_ptr]()
        {
            try
            {
                func();
            }
            catch (...)
            {
                *ex_ptr = std::current_exception();
            }
            completed->store(true, std::memory_order_release);
        });

    if (timeout.count() > 0)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!completed->load(std::memory_order_acquire))
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                thread.detach();
                return {false, true, {}};
            }
            constexpr std::chrono::milliseconds kPollInterval(10);
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    thread.join();

    if (*ex_ptr)
    {
        try
        {
            std::rethrow_exception(*ex_ptr);
        }
        catch (const std::exception &e)
        {
            return {false, false, e.what()};
        }
        catch (...)
        {
            return {false, false, "unknown exception"};
        }
    }
    return {true, false, {}};
}

} // namespace

namespace lockhub::utils
{

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    validate_callback_arg(arg);
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func, arg_str = std::string(arg)]()
        { startup_func(arg_str.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    validate_callback_arg(arg);
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown = [shutdown_func, arg_str = std::string(arg)]()
        { shutdown_func(arg_str.c_str()); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

enum class ModuleStatus
{
    Registered,
    Initializing,
    Started,
    Failed,
    Shutdown
};

class LifecycleManagerImpl
{
  public:
    struct InternalGraphNode
    {
        std::string name;
        std::function<void()> startup;
        std::function<void()> shutdown;
        std::chrono::milliseconds shutdown_timeout;
        std::vector<std::string> dependencies;
        std::vector<InternalGraphNode *> dependents;
        ModuleStatus status{ModuleStatus::Registered};
    };

    LifecycleManagerImpl()
        : m_app_name(lockhub::platform::get_executable_name()), m_pid(lockhub::platform::get_pid())
    {
    }

    void registerModule(InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);
    bool is_initialized() const { return m_is_initialized.load(std::memory_order_acquire); }
    bool is_finalized() const { return m_is_finalized.load(std::memory_order_acquire); }

  private:
    void buildGraph();
    static std::vector<InternalGraphNode *> topologicalSort(std::vector<InternalGraphNode *> nodes);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    std::string m_app_name;
    uint64_t m_pid;
    std::mutex m_registry_mutex;
    std::vector<InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};
};

void LifecycleManagerImpl::registerModule(InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        LKH_PANIC("[LKH_LifeCycle] Module '{}' registered after initialize().", def.name);
    }
    m_registered_modules.push_back(std::move(def));
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[LKH_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n",
                              m_app_name, m_pid, loc.function_name(),
                              lockhub::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildGraph();
        std::vector<InternalGraphNode *> nodes;
        nodes.reserve(m_module_graph.size());
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(std::move(nodes));
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        debug_info += fmt::format("     -> Starting module: '{}'...", mod->name);
        mod->status = ModuleStatus::Initializing;
        try
        {
            if (mod->startup)
            {
                mod->startup();
            }
        }
        catch (const std::exception &e)
        {
            mod->status = ModuleStatus::Failed;
            LKH_DEBUG("{}", debug_info);
            printStatusAndAbort("Exception during startup: " + std::string(e.what()), mod->name);
        }
        mod->status = ModuleStatus::Started;
        debug_info += "done.\n";
    }
    debug_info += "     -> Application initialization complete.\n";
    LKH_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[LKH_LifeCycle] [{}]:PID[{}]\n"
                              "     **** finalize() triggered from {} ({}:{})\n",
                              m_app_name, m_pid, loc.function_name(),
                              lockhub::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        InternalGraphNode *mod = *it;
        if (mod->status != ModuleStatus::Started)
        {
            continue;
        }
        debug_info += fmt::format("     <- Shutting down module: '{}'...", mod->name);
        const auto outcome = timedShutdown(mod->shutdown, mod->shutdown_timeout);
        mod->status = ModuleStatus::Shutdown;
        if (outcome.timed_out)
        {
            debug_info += "TIMEOUT!\n";
            fmt::print(stderr, "[LKH_LifeCycle] WARNING: shutdown of '{}' timed out after {}ms.\n",
                       mod->name, mod->shutdown_timeout.count());
        }
        else if (!outcome.success)
        {
            debug_info += "FAILED!\n";
            fmt::print(stderr, "[LKH_LifeCycle] WARNING: shutdown of '{}' threw: {}\n", mod->name,
                       outcome.exception_msg);
        }
        else
        {
            debug_info += "done.\n";
        }
    }
    debug_info += "     <- Application finalization complete.\n";
    LKH_DEBUG("{}", debug_info);
}

/**
 * @throws std::runtime_error on a duplicate module name or an undefined dependency.
 */
void LifecycleManagerImpl::buildGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        InternalGraphNode node;
        node.name = def.name;
        node.startup = std::move(def.startup);
        node.shutdown = std::move(def.shutdown);
        node.shutdown_timeout = def.shutdown_timeout;
        node.dependencies = std::move(def.dependencies);
        m_module_graph.emplace(def.name, std::move(node));
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name + " (required by " +
                                         entry.first + ")");
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over the dependency graph.
 * @throws std::runtime_error if a circular dependency is detected.
 */
std::vector<LifecycleManagerImpl::InternalGraphNode *>
LifecycleManagerImpl::topologicalSort(std::vector<InternalGraphNode *> nodes)
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<InternalGraphNode *> zero_degree_queue;
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = node->dependencies.size();
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (--in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[LKH_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[LKH_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}' [{} dependencies]\n", name, node.dependencies.size());
    }
    fmt::print(stderr, "---------------------\n\n");
    lockhub::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// LifecycleManager public API
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->registerModule(std::move(def.pImpl->def));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->is_initialized();
}

bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}

} // namespace lockhub::utils
