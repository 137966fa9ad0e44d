/// @file game_config.cpp
/// @brief GameConfig construction from ConfigManager keys.

#include "nsim/game/game_config.hpp"

#include <vector>

namespace nsim::game {

GameConfig GameConfig::fromConfig(const foundation::ConfigManager& config) {
    GameConfig cfg;

    cfg.version = config.getOr<std::string>("game.version", cfg.version);
    cfg.calendar.totalDays = config.getOr<int>("game.total_days", cfg.calendar.totalDays);
    cfg.calendar.periodsPerDay =
        config.getOr<int>("game.periods_per_day", cfg.calendar.periodsPerDay);

    auto periodNames = config.get<std::vector<std::string>>("game.period_names");
    if (periodNames) {
        cfg.calendar.periodNames = periodNames.value();
    }
    auto dayNames = config.get<std::vector<std::string>>("game.day_names");
    if (dayNames) {
        cfg.calendar.dayNames = dayNames.value();
    }

    auto seed = config.get<uint64_t>("random.seed");
    if (seed) {
        cfg.seed = seed.value();
    }

    cfg.schema.monetaryAttribute =
        config.getOr<std::string>("attributes.monetary", cfg.schema.monetaryAttribute);
    cfg.schema.luckAttribute =
        config.getOr<std::string>("attributes.luck_attribute", cfg.schema.luckAttribute);

    for (auto& [name, bounds] : cfg.schema.bounds) {
        const std::string prefix = "attributes." + name + ".";
        bounds.min = config.getOr<double>(prefix + "min", bounds.min);
        bounds.max = config.getOr<double>(prefix + "max", bounds.max);
        bounds.defaultValue = config.getOr<double>(prefix + "default", bounds.defaultValue);
    }

    return cfg;
}

}  // namespace nsim::game
