#include "build/build_log.hpp"

#include "util/time_utils.hpp"

#include <array>

namespace forge {

namespace {

constexpr std::array<std::string_view, 19> kKeywords{
    "Compiling", "Linking", "Building", "RAM:", "Flash:",
    "SUCCESS", "FAILED", "Error", "error:", "warning:",
    "Library", "LDF", "Scanning", "Found", "Checking",
    "Retrieving", "esptool", "Creating", "Merged",
};

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at s[i], or 0 if there is none.
std::size_t Utf8SequenceLength(std::string_view s, std::size_t i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) return 1;

    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;      // overlong
        else if (b0 == 0xED) hi = 0x9F; // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;      // overlong
        else if (b0 == 0xF4) hi = 0x8F; // above U+10FFFF
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;

    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if (b1 < lo || b1 > hi) return 0;
    for (std::size_t k = 2; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if (b < 0x80 || b > 0xBF) return 0;
    }
    return len;
}

} // namespace

std::string ToValidUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::size_t n = Utf8SequenceLength(bytes, i);
        if (n == 0) {
            out += kReplacementChar;
            ++i;
        } else {
            out.append(bytes, i, n);
            i += n;
        }
    }
    return out;
}

bool IsCompilationRelevant(std::string_view line) {
    for (const auto kw : kKeywords) {
        if (line.find(kw) != std::string_view::npos) return true;
    }
    return line.starts_with('[') || line.find('%') != std::string_view::npos;
}

LineFilter KeywordLineFilter() { return IsCompilationRelevant; }

LineFilter AcceptAllLines() {
    return [](std::string_view) { return true; };
}

BuildLog::BuildLog(std::size_t max_lines) : max_lines_(max_lines == 0 ? 1 : max_lines) {}

void BuildLog::Append(std::string line) {
    lines_.push_back(ToValidUtf8(line));
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

std::vector<std::string> BuildLog::Snapshot() const {
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

const std::string* BuildLog::FindLast(std::string_view marker) const {
    for (auto it = lines_.rbegin(); it != lines_.rend(); ++it) {
        if (it->find(marker) != std::string::npos) return &*it;
    }
    return nullptr;
}

std::string FormatBuildLogLine(std::string_view level, std::string_view message) {
    std::string out;
    out.reserve(message.size() + 24);
    out += '[';
    out += NowClockUtc();
    out += "] [";
    out += level;
    out += "] ";
    out += message;
    return out;
}

std::string ExtractUsageSummary(std::string_view line, std::string_view marker) {
    const auto pos = line.find(marker);
    if (pos == std::string_view::npos) return {};

    std::string_view rest = line.substr(pos + marker.size());
    // Drop the "[====      ]" bar when present.
    const auto bar_end = rest.rfind(']');
    if (bar_end != std::string_view::npos) {
        rest = rest.substr(bar_end + 1);
    }
    return std::string(Trim(rest));
}

} // namespace forge
