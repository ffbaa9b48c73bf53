/**
 * @file debug_info.cpp
 * @brief Stack trace printing for lockhub::debug::print_stack_trace().
 *
 * Only in-process information is printed (addresses, demangled symbol names and module
 * offsets); no external symbolizer is spawned, so the function is usable from a panic.
 */
#include "lkh_platform.hpp"
#include "utils/debug_info.hpp"

#include <cstdint>
#include <string>

#if defined(LOCKHUB_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

namespace lockhub::debug
{

namespace
{
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (...)
    {
        std::fputs("[stack trace formatting error]\n", stderr);
    }
}
} // anonymous namespace

void print_stack_trace() noexcept
{
    try
    {
#if defined(LOCKHUB_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        safe_format_to_stderr("Stack Trace (most recent call first):\n");
        for (int i = 0; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo) != 0)
            {
                std::string name;
                if (dlinfo.dli_sname != nullptr)
                {
                    int status = 0;
                    char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
                    if (status == 0 && dem != nullptr)
                    {
                        name = dem;
                        std::free(dem);
                    }
                    else
                    {
                        name = dlinfo.dli_sname;
                    }
                }
                const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                safe_format_to_stderr("{} ({} + {:#x})", name.empty() ? "??" : name,
                                      dlinfo.dli_fname != nullptr ? dlinfo.dli_fname : "?",
                                      static_cast<unsigned long long>(addr - base));
            }
            else
            {
                safe_format_to_stderr("[symbol unknown]");
            }
            safe_format_to_stderr("\n");
        }
#else
        safe_format_to_stderr("  [Stack trace not available on this platform]\n");
#endif
    }
    catch (...)
    {
        std::fputs("[print_stack_trace failed]\n", stderr);
    }
    std::fflush(stderr);
}

} // namespace lockhub::debug
