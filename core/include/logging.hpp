#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <optional>
#include <string>

namespace core {
namespace logging {

    // Creates the process-wide "PoosLogger": colored console sink plus a rotating
    // file sink at logs/<base_name>_<UTC timestamp>.log. SPDLOG_LEVEL overrides both levels.
    // Calling it again replaces the previous logger.
    void initialize(const std::string& base_name = "poos_backtest",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Throws std::runtime_error before initialize()
    std::shared_ptr<spdlog::logger>& getLogger();

    // Re-levels the sinks of the running logger (config is read after logging starts).
    // A SPDLOG_LEVEL override set at startup wins.
    void setLevels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level);

    // "trace" .. "critical", "off"; case-insensitive, "warning"/"err"/"crit" accepted
    std::optional<spdlog::level::level_enum> parseLevel(const std::string& level_str);

    // Empty before initialize()
    const std::string& logFilePath();

} // namespace logging
} // namespace core
