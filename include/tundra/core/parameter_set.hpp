#pragma once
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tundra::core {

// A strategy parameter is either numeric or categorical.
using ParameterValue = std::variant<double, std::string>;

bool is_numeric(const ParameterValue& value);
std::string to_string(const ParameterValue& value);

// Parses "20" / "1.5" as numeric, anything else as categorical.
ParameterValue parse_parameter_value(const std::string& text);

/**
 * @class ParameterSet
 * @brief Immutable name -> value mapping handed to a strategy.
 *
 * Entries keep the order they were added in (the declaration order of the
 * parameter domains). Two sets are equal when their entries are equal.
 */
class ParameterSet {
public:
    using Entry = std::pair<std::string, ParameterValue>;

    ParameterSet() = default;
    explicit ParameterSet(std::vector<Entry> entries);

    // Returns a copy with `name` set to `value` (replaced in place if present).
    ParameterSet with(const std::string& name, ParameterValue value) const;

    bool contains(const std::string& name) const;
    const ParameterValue* find(const std::string& name) const;

    double get_double(const std::string& name, double default_value) const;
    int get_int(const std::string& name, int default_value) const;
    std::string get_string(const std::string& name, const std::string& default_value) const;

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // {name=value, ...}
    std::string to_string() const;

    bool operator==(const ParameterSet& other) const { return entries_ == other.entries_; }
    bool operator!=(const ParameterSet& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

struct ParameterDomain {
    std::string name;
    std::vector<ParameterValue> values;

    ParameterDomain() = default;
    ParameterDomain(std::string n, std::vector<ParameterValue> v)
        : name(std::move(n)), values(std::move(v)) {}

    static ParameterDomain numeric(std::string n, const std::vector<double>& v);
    static ParameterDomain categorical(std::string n, const std::vector<std::string>& v);

    bool all_numeric() const;
};

} // namespace tundra::core
