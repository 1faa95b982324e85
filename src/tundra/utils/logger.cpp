#include <tundra/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace tundra::utils {

std::mutex Logger::console_mutex_;
std::atomic<LogLevel> Logger::current_level_{LogLevel::INFO};

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::operator<<(const EndlType&) {
    if (level_ >= current_level_.load(std::memory_order_relaxed)) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count() % 1000;

        std::tm tm{};
        localtime_r(&time, &tm);

        std::stringstream time_str;
        time_str << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        time_str << '.' << std::setfill('0') << std::setw(3) << ms;

        std::lock_guard<std::mutex> lock(console_mutex_);

        std::cout << "[" << time_str.str() << "] ";

        switch (level_) {
            case LogLevel::DEBUG:
                std::cout << "[DEBUG] ";
                break;
            case LogLevel::INFO:
                std::cout << "[INFO] ";
                break;
            case LogLevel::WARN:
                std::cout << "[WARN] ";
                break;
            case LogLevel::LOG_ERROR:
                std::cout << "[ERROR] ";
                break;
        }

        std::cout << stream_.str() << std::endl;
    }

    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return current_level_.load(std::memory_order_relaxed);
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    return LogLevel::INFO;
}

} // namespace tundra::utils
