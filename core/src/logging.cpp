#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace core {
namespace logging {

    namespace {

        const char* kLoggerName = "PoosLogger";
        const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr size_t kMaxFileBytes = 10 * 1024 * 1024;
        constexpr size_t kMaxFiles = 5;

        struct LoggerState {
            std::shared_ptr<spdlog::logger> logger;
            spdlog::sink_ptr console_sink;
            spdlog::sink_ptr file_sink;
            std::string file_path;
            bool env_override = false;
        };

        LoggerState& state() {
            static LoggerState instance;
            return instance;
        }

        std::string logDirectory() {
            std::error_code ec;
            std::filesystem::create_directories("logs", ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create 'logs' (" << ec.message() << "), logging to '.'" << std::endl;
                return ".";
            }
            return "logs";
        }

        // <base>_<YYYYmmdd_HHMMSS>Z.log
        std::string timestampedName(const std::string& base_name) {
            std::time_t now = std::time(nullptr);
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            char stamp[32];
            std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &utc_tm);
            return fmt::format("{}_{}Z.log", base_name, stamp);
        }

        std::optional<spdlog::level::level_enum> environmentLevel() {
            const char* value = std::getenv("SPDLOG_LEVEL");
            if (value == nullptr || value[0] == '\0') {
                return std::nullopt;
            }
            auto level = parseLevel(value);
            if (!level) {
                std::cerr << "[Logging] Ignoring unrecognized SPDLOG_LEVEL '" << value << "'" << std::endl;
            }
            return level;
        }

        void applyLevels(LoggerState& s, spdlog::level::level_enum console_level,
                         spdlog::level::level_enum file_level) {
            s.console_sink->set_level(console_level);
            if (s.file_sink) {
                s.file_sink->set_level(file_level);
                s.logger->set_level(std::min(console_level, file_level));
            } else {
                s.logger->set_level(console_level);
            }
        }

    } // namespace

    void initialize(const std::string& base_name,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        LoggerState& s = state();
        s.env_override = false;
        if (auto env_level = environmentLevel()) {
            console_level = *env_level;
            file_level = *env_level;
            s.env_override = true;
        }

        std::string file_path = logDirectory() + "/" + timestampedName(base_name);
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kPattern);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, kMaxFileBytes, kMaxFiles, true);
            file_sink->set_pattern(kPattern);

            spdlog::drop(kLoggerName);
            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
            auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            spdlog::register_logger(logger);
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::err);

            s.logger = logger;
            s.console_sink = console_sink;
            s.file_sink = file_sink;
            s.file_path = file_path;
        } catch (const spdlog::spdlog_ex& ex) {
            // No file sink: keep going on the console alone
            std::cerr << "[Logging] Cannot open log file '" << file_path << "': " << ex.what() << std::endl;
            spdlog::drop(kLoggerName);
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kPattern);
            s.logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
            spdlog::register_logger(s.logger);
            s.console_sink = console_sink;
            s.file_sink.reset();
            s.file_path.clear();
        }

        applyLevels(s, console_level, file_level);

        #ifdef NDEBUG
            const char* build_type = "Release";
        #else
            const char* build_type = "Debug";
        #endif
        s.logger->info("Logging initialized ({} build). Console: {}, File: {} -> {}",
                       build_type,
                       spdlog::level::to_string_view(console_level),
                       spdlog::level::to_string_view(file_level),
                       s.file_path.empty() ? "(none)" : s.file_path);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        LoggerState& s = state();
        if (!s.logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return s.logger;
    }

    void setLevels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level) {
        LoggerState& s = state();
        if (!s.logger || s.env_override) {
            return;
        }
        applyLevels(s, console_level, file_level);
    }

    std::optional<spdlog::level::level_enum> parseLevel(const std::string& level_str) {
        std::string lower = level_str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "trace") return spdlog::level::trace;
        if (lower == "debug") return spdlog::level::debug;
        if (lower == "info") return spdlog::level::info;
        if (lower == "warn" || lower == "warning") return spdlog::level::warn;
        if (lower == "error" || lower == "err") return spdlog::level::err;
        if (lower == "critical" || lower == "crit") return spdlog::level::critical;
        if (lower == "off") return spdlog::level::off;
        return std::nullopt;
    }

    const std::string& logFilePath() {
        return state().file_path;
    }

} // namespace logging
} // namespace core
