#include "util/time_utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace forge {

namespace {

bool UtcNow(std::tm& tm, long& micros) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    micros = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
        1000000);
    return gmtime_r(&secs, &tm) != nullptr;
}

} // namespace

std::string NowIso8601Utc() {
    std::tm tm{};
    long micros = 0;
    if (!UtcNow(tm, micros)) return {};

    char date[32]{};
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[64]{};
    std::snprintf(out, sizeof(out), "%s.%06ld+00:00", date, micros);
    return out;
}

std::string NowClockUtc() {
    std::tm tm{};
    long micros = 0;
    if (!UtcNow(tm, micros)) return "--:--:--";

    char out[16]{};
    std::strftime(out, sizeof(out), "%H:%M:%S", &tm);
    return out;
}

} // namespace forge
