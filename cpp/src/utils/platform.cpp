/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the `leapcal::platform` utilities.
 *
 * Thread IDs come from the native OS API so that log lines can be correlated with
 * debugger and `top -H` output. Version information is baked in at configure time.
 */
#include "lcal_platform.hpp"
#include "leapcal_version.h"

#include <functional>
#include <thread>

#if defined(LEAPCAL_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif
#if defined(LEAPCAL_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace leapcal::platform
{

uint64_t get_native_thread_id() noexcept
{
#if defined(LEAPCAL_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(LEAPCAL_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LEAPCAL_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // Fallback for other POSIX or unknown systems.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

// --- Version information (from leapcal_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return LEAPCAL_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return LEAPCAL_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return LEAPCAL_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return LEAPCAL_VERSION_STRING;
}

} // namespace leapcal::platform
