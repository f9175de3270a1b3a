#include "system/signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

namespace forge {

std::atomic_bool g_cancel{false};

namespace {

void RequestCancel(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

Result Install(int signo, void (*handler)(int), int flags) {
    struct sigaction sa{};
    sa.sa_handler = handler;
    sa.sa_flags = flags;
    sigemptyset(&sa.sa_mask);
    if (::sigaction(signo, &sa, nullptr) != 0) {
        const int e = errno;
        return Result::Fail(ErrorCode::Internal,
                            "sigaction(" + std::to_string(signo) + ") failed: " + std::strerror(e), e);
    }
    return Result::Ok();
}

} // namespace

Result InstallSignalHandlers() {
    for (int signo : {SIGINT, SIGTERM}) {
        if (auto r = Install(signo, RequestCancel, SA_RESETHAND | SA_RESTART); !r.is_ok()) return r;
    }
    // A toolchain that dies while we read its pipe must not take us down.
    return Install(SIGPIPE, SIG_IGN, 0);
}

} // namespace forge
