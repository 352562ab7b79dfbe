/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>
#include <vector>

namespace orbis::core
{

namespace
{
    const char* const kPattern = "[%T.%e] [%n] [%^%l%$] %v";

    // Console-only, never registered, so it outlives spdlog::drop_all()
    std::shared_ptr<spdlog::logger> fallback_logger()
    {
        static const std::shared_ptr<spdlog::logger> logger = []
        {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_pattern(kPattern);
            auto fallback = std::make_shared<spdlog::logger>("ORBIS", std::move(sink));
            fallback->set_level(spdlog::level::info);
            return fallback;
        }();
        return logger;
    }
}

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const std::filesystem::path& log_file)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    console_sink->set_level(spdlog::level::info);
    sinks.push_back(console_sink);

    // Rotating file sink: 5 MB max size, 3 rotated files
    if (!log_file.empty())
    {
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    // -----------------------------------------------------------------
    // Core logger ("ORBIS"): geometry and inference
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("ORBIS", sinks.begin(), sinks.end());
    s_core_logger->set_level(spdlog::level::trace);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): demo program, user-facing
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(spdlog::level::trace);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Logger::get_core_logger()
{
    return s_core_logger ? s_core_logger : fallback_logger();
}

std::shared_ptr<spdlog::logger> Logger::get_app_logger()
{
    return s_app_logger ? s_app_logger : fallback_logger();
}

} // namespace orbis::core
