#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace forge {

std::string Base64Encode(std::span<const std::uint8_t> data);
std::optional<std::vector<std::uint8_t>> Base64Decode(const std::string& text);

} // namespace forge
