// include/tundra/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <memory>
#include <fstream>
#include <sstream>
#include <istream>

namespace tundra {
namespace utils {

class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string> keys_;  // first-seen order, parameter domains depend on it
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    static void trim(std::string& text) {
        text.erase(0, text.find_first_not_of(" \t\r"));
        text.erase(text.find_last_not_of(" \t\r") + 1);
    }

    void parse(std::istream& in) {
        values_.clear();
        keys_.clear();
        std::string line;
        while (std::getline(in, line)) {
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trim(key);
            trim(value);
            if (key.empty()) {
                continue;
            }

            if (values_.find(key) == values_.end()) {
                keys_.push_back(key);
            }
            values_[key] = value;
        }
    }

public:
    Config() = default;

    static std::shared_ptr<Config> instance() {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::make_shared<Config>();
        }
        return instance_;
    }

    // key = value lines, '#' starts a comment line
    bool load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        parse(file);
        return true;
    }

    void load_from_string(const std::string& text) {
        std::istringstream in(text);
        std::lock_guard<std::mutex> lock(mutex_);
        parse(in);
    }

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // true/false, yes/no, on/off, 1/0
    bool get_bool(const std::string& key, bool default_value) const;

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.find(key) != values_.end();
    }

    std::vector<std::string> keys_with_prefix(const std::string& prefix) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        if (values_.find(key) == values_.end()) {
            keys_.push_back(key);
        }
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace tundra
