/// @file logger.cpp
/// @brief Dual spdlog loggers sharing a console sink and an optional rotating file sink.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace skybricks::core
{

namespace
{

constexpr const char* kCoreLoggerName = "SKYBRICKS";
constexpr const char* kAppLoggerName = "APP";
constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

} // anonymous namespace

// ---- Static member definitions (sinkless until init) ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName);
std::shared_ptr<spdlog::logger> Logger::s_app_logger = std::make_shared<spdlog::logger>(kAppLoggerName);

void Logger::init(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    if (!config.log_file.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size, config.max_files);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    spdlog::drop(kCoreLoggerName);
    spdlog::drop(kAppLoggerName);

    // -----------------------------------------------------------------
    // Core logger ("SKYBRICKS"): library internals
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName, sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): command-line tool
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>(kAppLoggerName, sinks.begin(), sinks.end());
    s_app_logger->set_level(config.level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger->flush();
    s_app_logger->flush();
    spdlog::drop_all();

    s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName);
    s_app_logger = std::make_shared<spdlog::logger>(kAppLoggerName);
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace skybricks::core
