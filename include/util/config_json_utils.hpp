#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace forge::config::detail {

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out);

// Absent keys leave `out` untouched and succeed; a present key of the wrong
// type fails with InvalidArgument naming the key.
Result GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out);
Result GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out);
Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out);
Result GetStringListIfPresent(const nlohmann::json& j, const char* key, std::vector<std::string>& out);

} // namespace forge::config::detail
