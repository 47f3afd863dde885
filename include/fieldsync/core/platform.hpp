#pragma once

#include <ctime>

#ifdef _WIN32
    #define FIELDSYNC_PLATFORM_WINDOWS
#else
    #define FIELDSYNC_PLATFORM_POSIX
#endif

namespace fieldsync {

// Thread-safe conversion of a calendar time to UTC.
inline bool utc_time(std::time_t seconds, std::tm& out) {
#ifdef FIELDSYNC_PLATFORM_WINDOWS
    return gmtime_s(&out, &seconds) == 0;
#else
    return gmtime_r(&seconds, &out) != nullptr;
#endif
}

} // namespace fieldsync
