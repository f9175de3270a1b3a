#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace forge {

// Sequential reader over a regular file, used to stream stored artifacts.
// Symlinks and special files are refused so a served path is always the
// stored image itself.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

    std::uint64_t Offset() const { return offset_; }
    std::uint64_t Remaining() const { return size_ > offset_ ? size_ - offset_ : 0; }
    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_ = 0;
    std::uint64_t offset_ = 0;
};

} // namespace forge
