#pragma once
#include <string>
#include <utility>

namespace tundra::core {

enum class ErrorCode {
    Ok = 0,
    InvalidConfiguration,
    NoData,
    NoValidResults,
    Cancelled
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::InvalidConfiguration: return "invalid_configuration";
        case ErrorCode::NoData: return "no_data";
        case ErrorCode::NoValidResults: return "no_valid_results";
        case ErrorCode::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

// Outcome of an engine-level run. Expected failures travel in here instead of
// being thrown so callers can branch on `code`.
struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string reason;

    static Status ok() { return Status{}; }
    static Status failure(ErrorCode c, std::string why) {
        Status status;
        status.code = c;
        status.reason = std::move(why);
        return status;
    }

    bool is_ok() const { return code == ErrorCode::Ok; }
    explicit operator bool() const { return is_ok(); }
};

} // namespace tundra::core
