#include "crypto/base64.hpp"

#include <openssl/evp.h>

namespace forge {

std::string Base64Encode(std::span<const std::uint8_t> data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(),
                                  static_cast<int>(data.size()));
    if (n < 0) return {};
    out.resize(static_cast<size_t>(n));
    return out;
}

std::optional<std::vector<std::uint8_t>> Base64Decode(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) return std::nullopt;

    std::vector<std::uint8_t> out(3 * (text.size() / 4));
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t len = static_cast<size_t>(n);
    if (text.ends_with("==")) {
        len -= 2;
    } else if (text.ends_with('=')) {
        len -= 1;
    }
    out.resize(len);
    return out;
}

} // namespace forge
