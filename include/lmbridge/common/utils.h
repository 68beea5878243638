#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace lmbridge {
namespace utils {

// Logging utilities
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Process-wide logger shared by the proxy and worker contexts.
// Each line is tagged with the name of the execution context that wrote it.
class Logger {
public:
    static Logger& getInstance();

    void setLogLevel(LogLevel level);

    // Append to a file instead of stdout (empty path = stdout)
    bool setLogFile(const std::string& path);

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

private:
    Logger() : log_level_(LogLevel::INFO) {}

    mutable std::mutex mutex_;
    LogLevel log_level_;
    std::ofstream file_;
};

// Name of the execution context running on the calling thread ("main" if unset)
void setContextName(const std::string& name);
const std::string& contextName();

// Timing utilities
inline double getElapsedMs(const std::chrono::time_point<std::chrono::steady_clock>& start,
                           const std::chrono::time_point<std::chrono::steady_clock>& end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

inline double getElapsedSeconds(const std::chrono::time_point<std::chrono::steady_clock>& start,
                                const std::chrono::time_point<std::chrono::steady_clock>& end) {
    return std::chrono::duration<double>(end - start).count();
}

// Milliseconds since the Unix epoch
inline int64_t nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// String formatting
template<typename... Args>
std::string format(const char* fmt, Args... args) {
    size_t size = std::snprintf(nullptr, 0, fmt, args...) + 1;
    std::unique_ptr<char[]> buf(new char[size]);
    std::snprintf(buf.get(), size, fmt, args...);
    return std::string(buf.get(), buf.get() + size - 1);
}

} // namespace utils
} // namespace lmbridge
