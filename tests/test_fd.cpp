#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace forge {
namespace {

bool IsOpen(int fd) { return ::fcntl(fd, F_GETFD) != -1; }

TEST(FdTest, ClosesOnDestructionAndMove) {
    int raw = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(raw, 0);
    {
        Fd a(raw);
        Fd b(std::move(a));
        EXPECT_FALSE(a.Valid());
        EXPECT_EQ(b.Get(), raw);
        EXPECT_TRUE(IsOpen(raw));
    }
    EXPECT_FALSE(IsOpen(raw));
}

TEST(FdTest, ReleaseKeepsDescriptorOpen) {
    Fd a(::open("/dev/null", O_RDONLY));
    ASSERT_TRUE(a.Valid());
    const int raw = a.Release();
    EXPECT_FALSE(a.Valid());
    EXPECT_TRUE(IsOpen(raw));
    ::close(raw);
}

TEST(FdTest, PipeEndsAreCloseOnExec) {
    Fd r, w;
    ASSERT_TRUE(Fd::MakePipe(r, w).is_ok());
    EXPECT_TRUE(::fcntl(r.Get(), F_GETFD) & FD_CLOEXEC);
    EXPECT_TRUE(::fcntl(w.Get(), F_GETFD) & FD_CLOEXEC);

    ASSERT_EQ(::write(w.Get(), "ok", 2), 2);
    w.Close();
    char buf[4] = {};
    EXPECT_EQ(::read(r.Get(), buf, sizeof(buf)), 2);
    EXPECT_EQ(::read(r.Get(), buf, sizeof(buf)), 0);
}

TEST(FdTest, NeverClosesStandardStreams) {
    {
        Fd err(STDERR_FILENO);
    }
    EXPECT_TRUE(IsOpen(STDERR_FILENO));
}

} // namespace
} // namespace forge
