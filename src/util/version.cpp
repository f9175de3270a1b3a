#include "util/version.hpp"

#include <charconv>
#include <ranges>
#include <string_view>

namespace forge {

bool VersionString::IsValid(const std::string& version) {
    std::string_view core(version);
    const auto suffix = core.find_first_of("-+");
    if (suffix != std::string_view::npos) {
        if (suffix + 1 >= core.size()) return false;
        core = core.substr(0, suffix);
    }
    if (core.empty()) return false;

    auto parts = core | std::views::split('.') |
                 std::views::transform([](auto&& rng) { return std::string_view(rng); });

    int count = 0;
    for (const auto sv : parts) {
        if (sv.empty()) return false;
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) return false;
        ++count;
    }
    return count >= 2 && count <= 3;
}

} // namespace forge
