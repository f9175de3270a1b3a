#pragma once

#include <string>
#include <string_view>

namespace forge {

struct BoardProfile {
    std::string_view board_type;
    std::string_view platform;
    std::string_view board;
    std::string_view framework;
    std::string_view monitor_speed;
};

inline constexpr std::string_view kDefaultBoardType = "ESP32-C3";

// Unknown board types resolve to the default profile rather than failing.
const BoardProfile& FindBoardProfile(std::string_view board_type);
bool IsKnownBoardType(std::string_view board_type);

// PlatformIO environment name: lower case, only [a-z0-9_] kept
// ("ESP32-C3" -> "esp32c3"). Falls back to the default board's name when
// nothing usable remains.
std::string BoardEnvName(std::string_view board_type);

std::string GeneratePlatformioIni(std::string_view board_type);

} // namespace forge
