#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

inline constexpr std::size_t kDefaultMaxLogLines = 500;

// Decides whether a toolchain output line is kept in the durable build log.
using LineFilter = std::function<bool(std::string_view)>;

// Keyword allow-list for PlatformIO output: progress, size reports, errors.
bool IsCompilationRelevant(std::string_view line);
LineFilter KeywordLineFilter();
LineFilter AcceptAllLines();

// Replaces every ill-formed UTF-8 sequence with U+FFFD. Toolchain output is
// arbitrary bytes; build records must stay valid JSON strings.
std::string ToValidUtf8(std::string_view bytes);

// Last-N line buffer. Appending past the cap evicts the oldest line.
// Lines are stored as valid UTF-8.
class BuildLog {
public:
    explicit BuildLog(std::size_t max_lines = kDefaultMaxLogLines);

    void Append(std::string line);
    std::vector<std::string> Snapshot() const;

    std::size_t Size() const { return lines_.size(); }
    std::size_t Capacity() const { return max_lines_; }
    bool Empty() const { return lines_.empty(); }

    // Most recent line containing `marker`, scanning newest first.
    const std::string* FindLast(std::string_view marker) const;

private:
    std::size_t max_lines_;
    std::deque<std::string> lines_;
};

// "[HH:MM:SS] [LEVEL] message"
std::string FormatBuildLogLine(std::string_view level, std::string_view message);

// Value part of a memory summary line such as
// "RAM:   [=         ]  10.3% (used 33756 bytes from 327680 bytes)".
// Returns an empty string when `marker` is absent.
std::string ExtractUsageSummary(std::string_view line, std::string_view marker);

} // namespace forge
