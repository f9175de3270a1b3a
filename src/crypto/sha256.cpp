#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <vector>

namespace forge {

namespace {

using Digest = std::array<std::uint8_t, 32>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string ToHex(const Digest& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(digest.size() * 2, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
        out[i * 2] = kHex[digest[i] >> 4];
        out[i * 2 + 1] = kHex[digest[i] & 0xF];
    }
    return out;
}

// Drains `reader` into a SHA-256 context. `total` counts the bytes hashed.
Result HashStream(IReader& reader, std::string& out_hex, std::uint64_t& total) {
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result::Fail(ErrorCode::Internal, "sha256 init failed");
    }

    std::vector<std::uint8_t> buf(kSha256ChunkSize);
    total = 0;
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorCode::Io, "read failed while hashing");
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            return Result::Fail(ErrorCode::Internal, "sha256 update failed");
        }
        total += static_cast<std::uint64_t>(n);
    }

    Digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        return Result::Fail(ErrorCode::Internal, "sha256 final failed");
    }
    out_hex = ToHex(digest);
    return Result::Ok();
}

} // namespace

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Digest digest{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != digest.size()) {
        return {};
    }
    return ToHex(digest);
}

std::string Sha256Hex(const std::string& data) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

std::string Sha256Hex(IReader& reader) {
    std::string hex;
    std::uint64_t total = 0;
    if (!HashStream(reader, hex, total).is_ok()) return {};
    return hex;
}

Result Sha256HexFile(const std::string& path, std::string& out_hex, std::uint64_t* out_size) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;

    std::uint64_t total = 0;
    r = HashStream(reader, out_hex, total);
    if (!r.is_ok()) {
        r.msg += ": " + path;
        return r;
    }
    if (out_size) *out_size = total;
    return Result::Ok();
}

} // namespace forge
