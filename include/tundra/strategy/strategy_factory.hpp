// include/tundra/strategy/strategy_factory.hpp
#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <vector>
#include <algorithm>
#include "tundra/strategy/strategy_base.hpp"

namespace tundra {
namespace strategy {

class StrategyFactory {
private:
    using StrategyCreator = std::function<StrategyPtr()>;

    // Function-local statics: strategies register themselves from static
    // initializers in other translation units.
    static std::unordered_map<std::string, StrategyCreator>& creators();
    static std::mutex& factory_mutex();

public:
    // Register a strategy type with the factory
    template<typename T>
    static void register_type(const std::string& type_name) {
        std::lock_guard<std::mutex> lock(factory_mutex());
        creators()[type_name] = [type_name]() -> StrategyPtr {
            return std::make_shared<T>(type_name);
        };
    }

    static bool has_type(const std::string& type_name) {
        std::lock_guard<std::mutex> lock(factory_mutex());
        return creators().find(type_name) != creators().end();
    }

    // Create a strategy instance by type name and configure it. Returns
    // nullptr for an unknown type.
    static StrategyPtr create_strategy(const std::string& type_name,
                                       const core::ParameterSet& params = core::ParameterSet()) {
        StrategyCreator creator;
        {
            std::lock_guard<std::mutex> lock(factory_mutex());
            auto it = creators().find(type_name);
            if (it == creators().end()) {
                return nullptr;
            }
            creator = it->second;
        }
        StrategyPtr strategy = creator();
        strategy->configure(params);
        return strategy;
    }

    // Builder that optimizer and walk-forward runs call once per combination
    static StrategyBuilder builder_for(const std::string& type_name) {
        return [type_name](const core::ParameterSet& params) {
            return create_strategy(type_name, params);
        };
    }

    // Get all registered strategy types, sorted
    static std::vector<std::string> get_registered_types() {
        std::lock_guard<std::mutex> lock(factory_mutex());
        std::vector<std::string> types;
        for (const auto& [type, _] : creators()) {
            types.push_back(type);
        }
        std::sort(types.begin(), types.end());
        return types;
    }
};

} // namespace strategy
} // namespace tundra
