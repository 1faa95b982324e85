#include <tundra/core/time_utils.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace tundra::core {

int64_t day_index(int64_t timestamp) {
    int64_t day = timestamp / kSecondsPerDay;
    if (timestamp % kSecondsPerDay < 0) {
        --day;
    }
    return day;
}

std::optional<int64_t> parse_timestamp(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\"");
    size_t end = text.find_last_not_of(" \t\"\r");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::string trimmed = text.substr(begin, end - begin + 1);

    bool numeric = true;
    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (!std::isdigit(static_cast<unsigned char>(c)) && !(i == 0 && c == '-')) {
            numeric = false;
            break;
        }
    }
    if (numeric) {
        try {
            return static_cast<int64_t>(std::stoll(trimmed));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    for (auto& c : trimmed) {
        if (c == 'T') c = ' ';
    }

    std::tm tm{};
    std::istringstream in(trimmed);
    if (trimmed.size() > 10) {
        in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        in >> std::get_time(&tm, "%Y-%m-%d");
    }
    if (in.fail()) {
        return std::nullopt;
    }

    return static_cast<int64_t>(timegm(&tm));
}

std::string format_date(int64_t timestamp) {
    time_t secs = static_cast<time_t>(timestamp);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

std::string format_datetime(int64_t timestamp) {
    time_t secs = static_cast<time_t>(timestamp);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buffer);
}

} // namespace tundra::core
