#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace skybricks::core
{
    /// @brief Logger setup. Use designated initializers:
    /// Logger::init({.level = spdlog::level::debug, .log_file = "skybricks.log"});
    struct LoggerConfig
    {
        spdlog::level::level_enum level = spdlog::level::info;
        std::string log_file;                       ///< Empty = console only
        std::size_t max_file_size = 5 * 1024 * 1024;
        std::size_t max_files = 3;
    };

    /// @brief Centralized logging facility for SkyBricks.
    ///
    /// Provides two separate loggers:
    /// - **SKYBRICKS** (core): tiling construction, index and table internals
    /// - **APP**: command-line tool, user-facing messages
    ///
    /// Until init() is called both loggers exist without sinks, so library
    /// code can log unconditionally and a host that never calls init() sees
    /// nothing.
    class Logger
    {
    public:
        /// @brief Attach a colored console sink (and a rotating file sink when
        /// config.log_file is set) to both loggers.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and detach all sinks. Loggers stay valid but silent.
        static void shutdown();

        /// @brief Access the library-internal logger ("SKYBRICKS").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skybricks::core

// -----------------------------------------------------------------
// Core library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKB_CORE_TRACE(...)    ::skybricks::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKB_CORE_DEBUG(...)    ::skybricks::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SKB_CORE_INFO(...)     ::skybricks::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKB_CORE_WARN(...)     ::skybricks::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKB_CORE_ERROR(...)    ::skybricks::core::Logger::get_core_logger()->error(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKB_TRACE(...)         ::skybricks::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKB_DEBUG(...)         ::skybricks::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SKB_INFO(...)          ::skybricks::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKB_WARN(...)          ::skybricks::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKB_ERROR(...)         ::skybricks::core::Logger::get_app_logger()->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
