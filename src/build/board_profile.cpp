#include "build/board_profile.hpp"

#include <array>
#include <cctype>

namespace forge {

namespace {

constexpr std::array<BoardProfile, 3> kProfiles{{
    {"ESP32-C3", "espressif32", "esp32-c3-devkitm-1", "espidf", "115200"},
    {"ESP32",    "espressif32", "esp32dev",           "espidf", "115200"},
    {"ESP32-S3", "espressif32", "esp32-s3-devkitc-1", "espidf", "115200"},
}};

} // namespace

const BoardProfile& FindBoardProfile(std::string_view board_type) {
    for (const auto& p : kProfiles) {
        if (p.board_type == board_type) return p;
    }
    return kProfiles.front();
}

bool IsKnownBoardType(std::string_view board_type) {
    for (const auto& p : kProfiles) {
        if (p.board_type == board_type) return true;
    }
    return false;
}

std::string BoardEnvName(std::string_view board_type) {
    std::string out;
    out.reserve(board_type.size());
    for (char c : board_type) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) && u < 0x80) {
            out.push_back(static_cast<char>(std::tolower(u)));
        } else if (c == '_') {
            out.push_back(c);
        }
    }
    // The name is an ini section, a CLI argument and a path component.
    if (out.empty()) return BoardEnvName(kDefaultBoardType);
    return out;
}

std::string GeneratePlatformioIni(std::string_view board_type) {
    const BoardProfile& p = FindBoardProfile(board_type);
    std::string ini;
    ini += "[env:" + BoardEnvName(board_type) + "]\n";
    ini += "platform = " + std::string(p.platform) + "\n";
    ini += "board = " + std::string(p.board) + "\n";
    ini += "framework = " + std::string(p.framework) + "\n";
    ini += "monitor_speed = " + std::string(p.monitor_speed) + "\n";
    ini += "board_build.partitions = default.csv\n";
    return ini;
}

} // namespace forge
