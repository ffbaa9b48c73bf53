/**
 * @file platform.cpp
 * @brief Cross-platform implementations for core OS-specific utilities.
 *
 * Process and thread ids and the executable path. Preprocessor directives select
 * the implementation for Windows, macOS, Linux and other POSIX systems.
 */
#include "lkh_platform.hpp"

#include <filesystem>
#include <functional>
#include <thread>
#include <vector>

#if defined(LOCKHUB_IS_POSIX)
#include <climits>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(LOCKHUB_PLATFORM_APPLE)
#include <mach-o/dyld.h> // _NSGetExecutablePath
#include <pthread.h>
#endif

#include <fmt/core.h>

namespace lockhub::platform
{

uint64_t get_pid()
{
#if defined(LOCKHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(LOCKHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(LOCKHUB_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LOCKHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(LOCKHUB_PLATFORM_WIN64)
        std::vector<wchar_t> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = std::filesystem::path(std::wstring(buf.data(), len)).string();
#elif defined(LOCKHUB_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(LOCKHUB_PLATFORM_APPLE)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::vector<char> buf(size);
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
        {
            return "unknown_apple";
        }
        full_path = std::filesystem::canonical(std::filesystem::path(buf.data())).string();
#else
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    catch (...)
    {
        fmt::print(stderr, "Warning: get_executable_name failed with unknown exception.\n");
    }
    return "unknown";
}

} // namespace lockhub::platform
