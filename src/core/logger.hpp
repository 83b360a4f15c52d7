#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace astrolabe::core
{
    /// @brief Logger settings supplied by the host at startup.
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        bool log_to_file = true;
        std::string file_name = "astrolabe.log";
    };

    /// @brief Centralized logging facility for Astrolabe.
    ///
    /// Provides two separate loggers:
    /// - **ASTROLABE** (core): aspect, pattern and ashtakavarga engines
    /// - **APP**: command-line front end, loaders, user-facing messages
    ///
    /// Both write to colored console output and, when enabled, a rotating log file.
    /// Hosts should call init() once before logging; if they don't, the first
    /// access installs console-only loggers at warn level. That first access is
    /// safe from any number of threads. init() and shutdown() themselves belong
    /// to the host and must not overlap with logging on other threads.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console (+ optional file) sinks.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the engine-internal logger ("ASTROLABE").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void ensure_initialized();

        /// Builds both loggers. Caller holds s_mutex.
        static void install(const LoggerConfig& config);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;

        static std::mutex        s_mutex;
        static std::atomic<bool> s_ready;
    };

} // namespace astrolabe::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ALB_CORE_TRACE(...)    ::astrolabe::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ALB_CORE_DEBUG(...)    ::astrolabe::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ALB_CORE_INFO(...)     ::astrolabe::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ALB_CORE_WARN(...)     ::astrolabe::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ALB_CORE_ERROR(...)    ::astrolabe::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ALB_CORE_CRITICAL(...) ::astrolabe::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ALB_TRACE(...)         ::astrolabe::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ALB_DEBUG(...)         ::astrolabe::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define ALB_INFO(...)          ::astrolabe::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ALB_WARN(...)          ::astrolabe::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ALB_ERROR(...)         ::astrolabe::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ALB_CRITICAL(...)      ::astrolabe::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
