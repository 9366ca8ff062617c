/// @file test_logger.cpp
/// @brief Unit tests for the injected logger factory.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>

using namespace zenith;
using namespace zenith::core;

TEST_CASE("Created loggers are not registered globally")
{
    auto logger = Logger::create({.name = "zenith-test-unregistered", .console = false});
    REQUIRE(logger != nullptr);
    CHECK(logger->name() == "zenith-test-unregistered");
    CHECK(spdlog::get("zenith-test-unregistered") == nullptr);
}

TEST_CASE("Level comes from the configuration")
{
    auto logger = Logger::create({.level = spdlog::level::warn, .console = false});
    CHECK(logger->level() == spdlog::level::warn);
    CHECK(logger->sinks().empty());
}

TEST_CASE("Null logger swallows everything")
{
    auto logger = Logger::create_null();
    CHECK(logger->level() == spdlog::level::off);
    ZEN_ERROR(logger, "not shown {}", 1);
}

TEST_CASE("or_null fills in a missing logger and keeps a given one")
{
    auto given = Logger::create({.console = false});
    CHECK(Logger::or_null(given) == given);

    auto filled = Logger::or_null(nullptr);
    REQUIRE(filled != nullptr);
    CHECK(filled->level() == spdlog::level::off);
}

TEST_CASE("Macros write through the injected logger")
{
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%l %v");

    ZEN_INFO(logger, "sky enabled ({})", 42);
    ZEN_DEBUG(logger, "below the default level");
    logger->flush();

    CHECK(out.str().find("info sky enabled (42)") != std::string::npos);
    CHECK(out.str().find("below the default level") == std::string::npos);
}
