#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace forge {

class IReader {
public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 at end of stream, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

} // namespace forge
