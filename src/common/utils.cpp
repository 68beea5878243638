#include "lmbridge/common/utils.h"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace lmbridge {
namespace utils {

namespace {
thread_local std::string t_context_name = "main";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_level_ = level;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < log_level_) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARN"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
    }

    std::ostream& out = file_.is_open() ? static_cast<std::ostream&>(file_) : std::cout;
    out << "[" << std::put_time(&tm_buf, "%H:%M:%S")
        << "] [" << level_str << "] [" << t_context_name << "] " << message << std::endl;
}

void setContextName(const std::string& name) {
    t_context_name = name;
}

const std::string& contextName() {
    return t_context_name;
}

} // namespace utils
} // namespace lmbridge
