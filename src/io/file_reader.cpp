#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace forge {

Result FileReader::Open(std::string path, FileReader& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW));
    if (!fd.Valid()) {
        const int e = errno;
        if (e == ENOENT) {
            return Result::Fail(ErrorCode::NotFound, "No such file: " + path, e);
        }
        if (e == ELOOP) {
            return Result::Fail(ErrorCode::InvalidArgument, "Refusing to follow symlink: " + path, e);
        }
        return Result::Fail(ErrorCode::Io, "Failed to open " + path + " (" + std::strerror(e) + ")", e);
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        const int e = errno;
        return Result::Fail(ErrorCode::Io, "fstat failed for " + path + " (" + std::strerror(e) + ")", e);
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorCode::InvalidArgument, "Not a regular file: " + path);
    }

    out.path_ = std::move(path);
    out.fd_ = std::move(fd);
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    out.offset_ = 0;
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    if (!fd_.Valid()) {
        errno = EBADF;
        return -1;
    }
    ssize_t n;
    do {
        n = ::read(fd_.Get(), out.data(), out.size());
    } while (n < 0 && errno == EINTR);

    if (n > 0) offset_ += static_cast<std::uint64_t>(n);
    return n;
}

} // namespace forge
