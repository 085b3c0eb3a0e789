#include <MiProbe/Core/Types.h>

#include <cstdio>
#include <ctime>

namespace Mi::Probe {

// =============================================================================
// Time
// =============================================================================

Timestamp Now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

std::string FormatTimestamp(Timestamp ts) {
    int64_t ms = ToEpochMs(ts);
    int64_t seconds = ms / 1000;
    int32_t millis = static_cast<int32_t>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buf;
}

} // namespace Mi::Probe
