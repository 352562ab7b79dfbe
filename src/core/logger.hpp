#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace orbis::core
{
    /// @brief Centralized logging facility for orbis.
    ///
    /// Provides two separate loggers:
    /// - **ORBIS** (core): rotation algebra, star synthesis, curvature inference
    /// - **APP**: demo program and other user-facing messages
    ///
    /// Both write to colored console output and, optionally, a rotating log file.
    /// Call init() once from main(). Before init() and after shutdown() both
    /// accessors return a console-only fallback logger, so library code can
    /// be used without initializing logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers.
        /// @param log_file Rotating log file path; empty for console output only.
        static void init(const std::filesystem::path& log_file = "orbis.log");

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the core logger ("ORBIS").
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger> get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace orbis::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ORB_CORE_TRACE(...)    ::orbis::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ORB_CORE_INFO(...)     ::orbis::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ORB_CORE_WARN(...)     ::orbis::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ORB_CORE_ERROR(...)    ::orbis::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ORB_CORE_CRITICAL(...) ::orbis::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ORB_TRACE(...)         ::orbis::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ORB_INFO(...)          ::orbis::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ORB_WARN(...)          ::orbis::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ORB_ERROR(...)         ::orbis::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ORB_CRITICAL(...)      ::orbis::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
