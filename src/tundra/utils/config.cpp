// src/tundra/utils/config.cpp
#include "tundra/utils/config.hpp"
#include <algorithm>
#include <cctype>

namespace tundra {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::string value = get(key, std::string());
    if (value.empty()) {
        return default_value;
    }

    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return default_value;
}

std::vector<std::string> Config::keys_with_prefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> matches;
    for (const auto& key : keys_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            matches.push_back(key);
        }
    }
    return matches;
}

} // namespace utils
} // namespace tundra
