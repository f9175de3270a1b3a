#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace forge {

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) Reset(other.Release());
    return *this;
}

Result Fd::MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int e = errno;
        return Result::Fail(ErrorCode::Io, std::string("pipe2 failed: ") + std::strerror(e), e);
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Reset(int fd) {
    if (fd_ > STDERR_FILENO && fd_ != fd) ::close(fd_);
    fd_ = fd;
}

} // namespace forge
