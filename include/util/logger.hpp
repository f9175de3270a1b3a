#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace forge {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

const char* LogLevelName(LogLevel lvl);
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Process-wide diagnostics on stderr. Build output shown to operators lives
// in BuildLog, not here. Lines carry a small per-thread tag so concurrent
// builds can be told apart.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl) { level_.store(static_cast<int>(lvl), std::memory_order_relaxed); }
    LogLevel Level() const { return static_cast<LogLevel>(level_.load(std::memory_order_relaxed)); }
    bool Enabled(LogLevel lvl) const {
        return lvl != LogLevel::None && static_cast<int>(lvl) >= level_.load(std::memory_order_relaxed);
    }

    // nullptr restores stderr.
    void SetSink(std::FILE* sink);

    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;

    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
    std::mutex mu_;
    std::FILE* sink_ = nullptr;
};

#define FORGE_LOG(lvl, ...)                                                                  \
    do {                                                                                     \
        if (::forge::Logger::Instance().Enabled(lvl))                                        \
            ::forge::Logger::Instance().LogWithSource(lvl, __FILE__, __LINE__, __VA_ARGS__); \
    } while (0)

#define LogDebug(...) FORGE_LOG(::forge::LogLevel::Debug, __VA_ARGS__)
#define LogInfo(...)  FORGE_LOG(::forge::LogLevel::Info,  __VA_ARGS__)
#define LogWarn(...)  FORGE_LOG(::forge::LogLevel::Warn,  __VA_ARGS__)
#define LogError(...) FORGE_LOG(::forge::LogLevel::Error, __VA_ARGS__)

} // namespace forge
