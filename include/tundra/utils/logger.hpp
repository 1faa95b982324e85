#pragma once
#include <string>
#include <sstream>
#include <mutex>
#include <atomic>

namespace tundra::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};


class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    constexpr Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Accepts "debug", "info", "warn"/"warning", "error" in any case.
    // Unknown names fall back to INFO.
    static LogLevel parse_level(const std::string& name);

private:
    explicit Logger(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    // Read concurrently by optimizer worker threads.
    static std::atomic<LogLevel> current_level_;
};

} // namespace tundra::utils
