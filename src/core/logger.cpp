/// @file logger.cpp
/// @brief Logger factory: console + rotating file sinks, or a null sink.

#include "core/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>
#include <vector>

namespace zenith::core
{

namespace
{
constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";
} // namespace

std::shared_ptr<spdlog::logger> Logger::create(const LoggerConfig& config)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kPattern);
        sinks.push_back(std::move(console_sink));
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files);
        file_sink->set_pattern(kPattern);
        sinks.push_back(std::move(file_sink));
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> Logger::create_null(const std::string& name)
{
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(spdlog::level::off);
    return logger;
}

std::shared_ptr<spdlog::logger> Logger::or_null(std::shared_ptr<spdlog::logger> logger)
{
    if (logger) {
        return logger;
    }
    return create_null();
}

} // namespace zenith::core
