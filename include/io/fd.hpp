#pragma once

#include "util/result.hpp"

namespace forge {

// Owning file descriptor. Standard streams are never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { Close(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.Release()) {}
    Fd& operator=(Fd&& other) noexcept;

    // Close-on-exec pipe, so concurrently spawned toolchains never inherit
    // each other's ends.
    static Result MakePipe(Fd& read_end, Fd& write_end);

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Gives up ownership without closing.
    int Release();
    void Reset(int fd = -1);
    void Close() { Reset(); }

  private:
    int fd_{-1};
};

} // namespace forge
