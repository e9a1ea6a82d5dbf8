#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp> // Include JSON library header

#include "and_condition.hpp"
#include "config.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    class ConfigFactory {
    public:
        // Every key is optional; missing keys keep their defaults.
        // Throws core::ConfigException on wrong types or unknown enum values.
        static core::BacktestConfig fromJson(const json& config);

        // Parse a JSON file. Throws core::ConfigException if it cannot be read or parsed.
        static core::BacktestConfig loadFile(const std::string& path);

        // BT_* environment variables override the loaded values
        static void applyEnvironmentOverrides(core::BacktestConfig& config);

        // Effective configuration, written next to the run metrics
        static json toJson(const core::BacktestConfig& config);

        // Close < price_max AND Performance > perf_min AND AvgDollarVolume >= min_dollar_volume
        // AND RelativeStrength > 0
        static std::unique_ptr<AndCondition> createEntryScreen(const core::ScreenConfig& screen);
    };

} // namespace strategy_engine
