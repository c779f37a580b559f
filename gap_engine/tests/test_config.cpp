#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <stdexcept>
#include <stdlib.h>

TEST_CASE("Configuration from environment", "[config]") {
    unsetenv("WINDOW_CAPACITY");
    unsetenv("LISTEN_PORT");

    SECTION("Defaults validate") {
        Config cfg = Config::from_env();
        REQUIRE(cfg.window_capacity == 200);
        REQUIRE(cfg.stream_candles == "fvg.feed.candles");
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Overrides are read") {
        setenv("WINDOW_CAPACITY", "50", 1);
        Config cfg = Config::from_env();
        REQUIRE(cfg.window_capacity == 50);
        unsetenv("WINDOW_CAPACITY");
    }

    SECTION("Invalid integer falls back to default") {
        setenv("LISTEN_PORT", "not-a-port", 1);
        Config cfg = Config::from_env();
        REQUIRE(cfg.listen_port == 8090);
        unsetenv("LISTEN_PORT");
    }

    SECTION("Window below three fails validation") {
        setenv("WINDOW_CAPACITY", "2", 1);
        Config cfg = Config::from_env();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        unsetenv("WINDOW_CAPACITY");
    }
}
