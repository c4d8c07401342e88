#include <drift/utilities/logging.h>

#include <drift/utilities/errors.h>
#include <drift/utilities/testing.h>

using namespace drift;

TEST_CASE("drift logger", "[utilities][logging]")
{
    auto logger = get_logger();
    REQUIRE(logger);
    REQUIRE(logger->name() == logger_name);
    // It's registered with spdlog, so the embedding application can find it.
    REQUIRE(spdlog::get(logger_name) == logger);
    // And it's always the same one.
    REQUIRE(get_logger() == logger);
}

TEST_CASE("log level parsing", "[utilities][logging]")
{
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("critical") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE(
        require_error_info<invalid_enum_string, enum_string_info>(
            [] { parse_log_level("verbose"); })
        == "verbose");
}

TEST_CASE("logging initialization", "[utilities][logging]")
{
    initialize_logging(spdlog::level::debug);
    REQUIRE(get_logger()->level() == spdlog::level::debug);
    initialize_logging(spdlog::level::info);
    REQUIRE(get_logger()->level() == spdlog::level::info);
}
