// src/tundra/strategy/strategy_factory.cpp
#include "tundra/strategy/strategy_factory.hpp"

namespace tundra {
namespace strategy {

std::unordered_map<std::string, StrategyFactory::StrategyCreator>& StrategyFactory::creators() {
    static std::unordered_map<std::string, StrategyCreator> creators;
    return creators;
}

std::mutex& StrategyFactory::factory_mutex() {
    static std::mutex factory_mutex;
    return factory_mutex;
}

} // namespace strategy
} // namespace tundra
