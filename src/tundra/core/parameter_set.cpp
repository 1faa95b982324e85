#include <tundra/core/parameter_set.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace tundra::core {

bool is_numeric(const ParameterValue& value) {
    return std::holds_alternative<double>(value);
}

std::string to_string(const ParameterValue& value) {
    if (const double* number = std::get_if<double>(&value)) {
        std::ostringstream oss;
        if (std::floor(*number) == *number && std::fabs(*number) < 1e15) {
            oss << static_cast<long long>(*number);
        } else {
            oss << *number;
        }
        return oss.str();
    }
    return std::get<std::string>(value);
}

ParameterValue parse_parameter_value(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    size_t end = text.find_last_not_of(" \t\r");
    if (begin == std::string::npos) {
        return std::string();
    }
    std::string trimmed = text.substr(begin, end - begin + 1);

    try {
        size_t consumed = 0;
        double number = std::stod(trimmed, &consumed);
        if (consumed == trimmed.size() && std::isfinite(number)) {
            return number;
        }
    } catch (const std::exception&) {
        // not a number, fall through to categorical
    }
    return trimmed;
}

ParameterSet::ParameterSet(std::vector<Entry> entries) : entries_(std::move(entries)) {}

ParameterSet ParameterSet::with(const std::string& name, ParameterValue value) const {
    ParameterSet copy = *this;
    auto it = std::find_if(copy.entries_.begin(), copy.entries_.end(),
        [&name](const Entry& e) { return e.first == name; });
    if (it != copy.entries_.end()) {
        it->second = std::move(value);
    } else {
        copy.entries_.emplace_back(name, std::move(value));
    }
    return copy;
}

bool ParameterSet::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const ParameterValue* ParameterSet::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return e.first == name; });
    return it != entries_.end() ? &it->second : nullptr;
}

double ParameterSet::get_double(const std::string& name, double default_value) const {
    const ParameterValue* value = find(name);
    if (value == nullptr) {
        return default_value;
    }
    if (const double* number = std::get_if<double>(value)) {
        return *number;
    }
    ParameterValue parsed = parse_parameter_value(std::get<std::string>(*value));
    return is_numeric(parsed) ? std::get<double>(parsed) : default_value;
}

int ParameterSet::get_int(const std::string& name, int default_value) const {
    if (!contains(name)) {
        return default_value;
    }
    double number = get_double(name, static_cast<double>(default_value));
    return static_cast<int>(std::lround(number));
}

std::string ParameterSet::get_string(const std::string& name, const std::string& default_value) const {
    const ParameterValue* value = find(name);
    return value != nullptr ? core::to_string(*value) : default_value;
}

std::string ParameterSet::to_string() const {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << entries_[i].first << "=" << core::to_string(entries_[i].second);
    }
    oss << "}";
    return oss.str();
}

ParameterDomain ParameterDomain::numeric(std::string n, const std::vector<double>& v) {
    return ParameterDomain(std::move(n), std::vector<ParameterValue>(v.begin(), v.end()));
}

ParameterDomain ParameterDomain::categorical(std::string n, const std::vector<std::string>& v) {
    return ParameterDomain(std::move(n), std::vector<ParameterValue>(v.begin(), v.end()));
}

bool ParameterDomain::all_numeric() const {
    return !values.empty() &&
           std::all_of(values.begin(), values.end(),
                       [](const ParameterValue& v) { return is_numeric(v); });
}

} // namespace tundra::core
