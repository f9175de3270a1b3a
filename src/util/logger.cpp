#include "util/logger.hpp"

#include "util/time_utils.hpp"

#include <cstring>
#include <string>

namespace forge {

namespace {

// Small sequential id per thread; stable for the thread's lifetime.
unsigned ThreadTag() {
    static std::atomic<unsigned> next{0};
    thread_local const unsigned tag = next.fetch_add(1, std::memory_order_relaxed);
    return tag;
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

const char* LogLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "none")  return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetSink(std::FILE* sink) {
    std::lock_guard<std::mutex> lk(mu_);
    sink_ = sink;
}

void Logger::LogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    if (!Enabled(lvl)) return;

    // Formatted outside the lock; one write per line keeps lines whole.
    char msg[1024];
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(msg, sizeof(msg), fmt, copy);
    va_end(copy);

    std::string text = "[" + NowIso8601Utc() + "] [" + LogLevelName(lvl) + "] [t" + std::to_string(ThreadTag()) + "] ";
    if (const char* base = BaseName(file); base && line > 0) {
        text += "[";
        text += base;
        text += ":" + std::to_string(line) + "] ";
    }
    if (n >= static_cast<int>(sizeof(msg))) {
        std::string big(static_cast<size_t>(n) + 1, '\0');
        std::vsnprintf(big.data(), big.size(), fmt, ap);
        big.resize(static_cast<size_t>(n));
        text += big;
    } else if (n > 0) {
        text.append(msg, static_cast<size_t>(n));
    }
    text += '\n';

    std::lock_guard<std::mutex> lk(mu_);
    std::FILE* out = sink_ ? sink_ : stderr;
    std::fwrite(text.data(), 1, text.size(), out);
    std::fflush(out);
}

} // namespace forge
