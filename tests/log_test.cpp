#include <catch2/catch.hpp>

#include "fakes.h"

TEST_CASE("Messages below the minimum level are discarded", "[log]") {
    LogCapture log;
    Log::SetMinLevel(Log::LOGL_WARNING);

    Log::Write(Log::LOGL_INFO, "Test", "quiet");
    Log::Write(Log::LOGL_WARNING, "Test", "loud");
    Log::Writef(Log::LOGL_DEBUG, "Test", "value %d", 1);

    REQUIRE(log.Count() == 1);
    CHECK(LogCapture::Lines()[0].level == Log::LOGL_WARNING);
    CHECK(LogCapture::Lines()[0].message == "loud");
}

TEST_CASE("Writef formats its arguments", "[log]") {
    LogCapture log;
    Log::Writef(Log::LOGL_INFO, "Test", "%s=%d (%zu)", "width", 640, static_cast<size_t>(3));

    REQUIRE(log.Count() == 1);
    CHECK(LogCapture::Lines()[0].message == "width=640 (3)");
}

TEST_CASE("Level names", "[log]") {
    CHECK(std::string(Log::LevelName(Log::LOGL_CRITICAL)) == "CRITICAL");
    CHECK(std::string(Log::LevelName(Log::LOGL_WARNING)) == "WARNING");
    CHECK(std::string(Log::LevelName(Log::LOGL_INFO)) == "INFO");
    CHECK(std::string(Log::LevelName(Log::LOGL_DEBUG)) == "DEBUG");
    CHECK(std::string(Log::LevelName(Log::LOGL_TRACE)) == "TRACE");
}
