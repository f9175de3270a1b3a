#pragma once

#include <string>

namespace forge {

// "2024-05-01T12:34:56.789012+00:00"
std::string NowIso8601Utc();

// "12:34:56", used as the build log line prefix.
std::string NowClockUtc();

} // namespace forge
