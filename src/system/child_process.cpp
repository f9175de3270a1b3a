#include "system/child_process.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace forge {

namespace {

std::vector<std::string> BuildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [k, v] : overrides) {
            if (k == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(entry);
    }
    for (const auto& [k, v] : overrides) {
        env.push_back(k + "=" + v);
    }
    return env;
}

std::vector<char*> ToCharPtrs(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// Resolves `program` against the child's PATH. Runs before fork(): the child
// of a multithreaded process may only make async-signal-safe calls. Relative
// PATH entries are taken relative to the child's working directory. A name
// that is not found comes back unchanged and execve() then fails with 127.
std::string ResolveExecutable(const std::string& program,
                              const std::vector<std::string>& env,
                              const std::string& cwd) {
    if (program.find('/') != std::string::npos) return program;

    std::string path = "/usr/local/bin:/usr/bin:/bin";
    for (const auto& entry : env) {
        if (entry.rfind("PATH=", 0) == 0) {
            path = entry.substr(5);
            break;
        }
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        if (dir.front() != '/' && !cwd.empty()) dir = cwd + "/" + dir;

        const std::string candidate = dir + "/" + program;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return program;
}

void WriteRaw(int fd, const char* s) {
    (void)!::write(fd, s, std::strlen(s));
}

} // namespace

ChildProcess::~ChildProcess() {
    if (Running()) {
        Kill();
        int ignored = 0;
        (void)Wait(ignored);
    }
}

Result ChildProcess::Spawn(const Options& opt, ChildProcess& out) {
    if (opt.argv.empty() || opt.argv.front().empty()) {
        return Result::Fail(ErrorCode::InvalidArgument, "empty toolchain command");
    }

    // Built before fork(): only async-signal-safe calls happen in the child.
    std::vector<std::string> args = opt.argv;
    std::vector<std::string> env = BuildEnvironment(opt.env_overrides);
    std::string program = ResolveExecutable(args.front(), env, opt.cwd);
    std::vector<char*> argv = ToCharPtrs(args);
    std::vector<char*> envp = ToCharPtrs(env);

    Fd read_end;
    Fd write_end;
    if (auto r = Fd::MakePipe(read_end, write_end); !r.is_ok()) {
        return r;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        return Result::Fail(ErrorCode::Io, std::string("fork failed: ") + std::strerror(e), e);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::dup2(write_end.Get(), STDOUT_FILENO);
        ::dup2(write_end.Get(), STDERR_FILENO);
        if (!opt.cwd.empty() && ::chdir(opt.cwd.c_str()) != 0) {
            WriteRaw(STDERR_FILENO, "Error: cannot enter build directory\n");
            ::_exit(126);
        }
        ::execve(program.c_str(), argv.data(), envp.data());
        WriteRaw(STDERR_FILENO, "Error: cannot execute toolchain: ");
        WriteRaw(STDERR_FILENO, argv[0]);
        WriteRaw(STDERR_FILENO, "\n");
        ::_exit(127);
    }

    // Also set from the parent so Kill() works even if the child has not run yet.
    (void)::setpgid(pid, pid);

    write_end.Close();
    out.pid_ = pid;
    out.reaped_ = false;
    out.eof_ = false;
    out.pending_.clear();
    out.out_ = std::move(read_end);
    LogDebug("Spawned %s (pid %d) in %s", opt.argv.front().c_str(), (int)pid, opt.cwd.c_str());
    return Result::Ok();
}

ChildProcess::ReadStatus ChildProcess::ReadLine(std::chrono::milliseconds wait, std::string& out_line) {
    while (true) {
        const auto nl = pending_.find('\n');
        if (nl != std::string::npos || pending_.size() >= kMaxLineBytes) {
            const size_t len = (nl != std::string::npos) ? nl : kMaxLineBytes;
            out_line.assign(pending_, 0, len);
            pending_.erase(0, nl != std::string::npos ? nl + 1 : len);
            if (!out_line.empty() && out_line.back() == '\r') out_line.pop_back();
            return ReadStatus::Line;
        }
        if (eof_ || !out_.Valid()) {
            if (!pending_.empty()) {
                out_line = std::move(pending_);
                pending_.clear();
                if (!out_line.empty() && out_line.back() == '\r') out_line.pop_back();
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        pollfd pfd{};
        pfd.fd = out_.Get();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
        if (rc == 0) return ReadStatus::Timeout;
        if (rc < 0) {
            if (errno == EINTR) return ReadStatus::Timeout;
            return ReadStatus::Error;
        }

        char buf[4096];
        const ssize_t n = ::read(out_.Get(), buf, sizeof(buf));
        if (n == 0) {
            eof_ = true;
        } else if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ReadStatus::Error;
        } else {
            pending_.append(buf, static_cast<size_t>(n));
        }
    }
}

void ChildProcess::Kill() {
    if (!Running()) return;
    if (::kill(-pid_, SIGKILL) != 0) {
        (void)::kill(pid_, SIGKILL);
    }
}

Result ChildProcess::Reap(int options, bool& out_exited, int& out_exit_code) {
    out_exited = false;
    if (pid_ <= 0) return Result::Fail(ErrorCode::PreconditionFailed, "no child process");
    if (reaped_) return Result::Fail(ErrorCode::PreconditionFailed, "child already reaped");

    int status = 0;
    pid_t rc = 0;
    while ((rc = ::waitpid(pid_, &status, options)) < 0) {
        if (errno == EINTR) continue;
        const int e = errno;
        return Result::Fail(ErrorCode::Io, std::string("waitpid failed: ") + std::strerror(e), e);
    }
    if (rc == 0) return Result::Ok();

    reaped_ = true;
    out_exited = true;
    out_.Close();

    if (WIFEXITED(status)) {
        out_exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out_exit_code = 128 + WTERMSIG(status);
    } else {
        out_exit_code = -1;
    }
    return Result::Ok();
}

Result ChildProcess::Wait(int& out_exit_code) {
    bool exited = false;
    return Reap(0, exited, out_exit_code);
}

Result ChildProcess::TryWait(bool& out_exited, int& out_exit_code) {
    return Reap(WNOHANG, out_exited, out_exit_code);
}

} // namespace forge
