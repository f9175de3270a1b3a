#include "util/id_generator.hpp"

#include "util/logger.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <random>

namespace forge {

std::string GenerateId() {
    std::array<std::uint8_t, 16> b{};
    if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
        LogWarn("RAND_bytes failed, falling back to std::random_device for id");
        std::random_device rd;
        for (auto& v : b) v = static_cast<std::uint8_t>(rd());
    }
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < b.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[(b[i] >> 4) & 0xF]);
        out.push_back(kHex[b[i] & 0xF]);
    }
    return out;
}

} // namespace forge
