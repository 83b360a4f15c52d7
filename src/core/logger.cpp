/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace astrolabe::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;
std::mutex                      Logger::s_mutex;
std::atomic<bool>               Logger::s_ready{false};

namespace
{

constexpr const char* kCoreLoggerName = "ASTROLABE";
constexpr const char* kAppLoggerName  = "APP";
constexpr const char* kPattern        = "[%T.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    // Re-initialization replaces a previously registered logger of the same name
    spdlog::drop(name);

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void Logger::init(const LoggerConfig& config)
{
    const std::lock_guard<std::mutex> lock(s_mutex);
    install(config);
    s_ready.store(true, std::memory_order_release);
}

void Logger::install(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    if (config.log_to_file)
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_name, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    s_core_logger = make_logger(kCoreLoggerName, sinks, config.level);
    s_app_logger  = make_logger(kAppLoggerName, sinks, config.level);
}

void Logger::shutdown()
{
    const std::lock_guard<std::mutex> lock(s_mutex);
    s_ready.store(false, std::memory_order_release);
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

// -----------------------------------------------------------------
// Lazy setup: concurrent first use builds the loggers exactly once
// -----------------------------------------------------------------

void Logger::ensure_initialized()
{
    if (s_ready.load(std::memory_order_acquire))
    {
        return;
    }

    const std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_ready.load(std::memory_order_relaxed))
    {
        install(LoggerConfig{.level = spdlog::level::warn, .log_to_file = false});
        s_ready.store(true, std::memory_order_release);
    }
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    ensure_initialized();
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    ensure_initialized();
    return s_app_logger;
}

} // namespace astrolabe::core
