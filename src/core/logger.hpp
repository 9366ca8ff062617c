#pragma once

/// @file logger.hpp
/// @brief Factory for injected spdlog loggers (no process-wide registry).

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace zenith::core
{
    /// @brief Settings for one logger instance.
    struct LoggerConfig
    {
        std::string name = "ZENITH";
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
        std::string file_path;          ///< Empty: no file sink
        std::size_t max_file_size = 5 * 1024 * 1024;
        std::size_t max_files = 3;
    };

    /// @brief Builds loggers that are handed to components explicitly.
    ///
    /// Unlike spdlog's default logger, nothing created here is registered
    /// globally, so two sky controls in one process can log independently.
    class Logger
    {
    public:
        Logger() = delete;

        /// @brief Colored console sink and optional rotating file sink.
        [[nodiscard]] static std::shared_ptr<spdlog::logger> create(const LoggerConfig& config);

        /// @brief A logger that discards everything.
        [[nodiscard]] static std::shared_ptr<spdlog::logger> create_null(const std::string& name = "ZENITH");

        /// @brief Return the given logger, or a null logger if it is empty.
        [[nodiscard]] static std::shared_ptr<spdlog::logger> or_null(std::shared_ptr<spdlog::logger> logger);
    };

} // namespace zenith::core

// -----------------------------------------------------------------
// Log macros taking the injected logger as first argument
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ZEN_TRACE(logger, ...)    (logger)->trace(__VA_ARGS__)
#define ZEN_DEBUG(logger, ...)    (logger)->debug(__VA_ARGS__)
#define ZEN_INFO(logger, ...)     (logger)->info(__VA_ARGS__)
#define ZEN_WARN(logger, ...)     (logger)->warn(__VA_ARGS__)
#define ZEN_ERROR(logger, ...)    (logger)->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
