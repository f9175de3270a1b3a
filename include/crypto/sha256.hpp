#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace forge {

// Chunk size used when hashing streams. Affects throughput only.
inline constexpr std::size_t kSha256ChunkSize = 8 * 1024;

// Lower-case hex digests. The string overloads return "" if OpenSSL fails.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(const std::string& data);
std::string Sha256Hex(IReader& reader);

// Hashes a stored artifact and reports how many bytes went into the digest,
// so the recorded size always matches the recorded hash.
Result Sha256HexFile(const std::string& path, std::string& out_hex, std::uint64_t* out_size = nullptr);

} // namespace forge
