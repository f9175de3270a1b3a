#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace forge {

// A child process whose stdout and stderr are merged into one pipe and read
// line by line. The child leads its own process group so Kill() also reaches
// anything it spawned.
class ChildProcess {
public:
    struct Options {
        std::vector<std::string> argv;
        std::string cwd;
        std::vector<std::pair<std::string, std::string>> env_overrides;
    };

    enum class ReadStatus {
        Line,
        Eof,
        Timeout,
        Error,
    };

    static constexpr std::size_t kMaxLineBytes = 64 * 1024;

    ChildProcess() = default;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    static Result Spawn(const Options& opt, ChildProcess& out);

    // Waits at most `wait` for data. Trailing "\r" is stripped; a final
    // unterminated line is still returned before Eof.
    ReadStatus ReadLine(std::chrono::milliseconds wait, std::string& out_line);

    void Kill();
    Result Wait(int& out_exit_code);
    // Non-blocking; `out_exited` stays false while the child is still running.
    Result TryWait(bool& out_exited, int& out_exit_code);

    pid_t Pid() const { return pid_; }
    bool Running() const { return pid_ > 0 && !reaped_; }

private:
    Result Reap(int options, bool& out_exited, int& out_exit_code);

    pid_t pid_ = -1;
    bool reaped_ = false;
    bool eof_ = false;
    Fd out_;
    std::string pending_;
};

} // namespace forge
