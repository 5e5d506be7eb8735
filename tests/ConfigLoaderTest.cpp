#include <catch2/catch.hpp>

#include <sstream>

#include "yieldcraft/config/ConfigLoader.hpp"

using namespace yieldcraft;

TEST_CASE("INI values overlay the defaults", "[config]") {
    std::istringstream in(
        "# engine knobs\n"
        "[velocity]\n"
        "target_sell_ratio = 0.8\n"
        "window_hours = 48\n"
        "\n"
        "[pricing]\n"
        "brake_threshold = 2.0   # stricter\n"
        "; legacy comment\n"
        "[forecast]\n"
        "optimistic = 1.5\n"
        "[bundle]\n"
        "gain_threshold = 10000\n"
        "[alerts]\n"
        "opportunity_score = 0.9\n"
    );

    ConfigLoader loader;
    REQUIRE(loader.loadFromStream(in));

    EngineConfig cfg = loader.toConfig();
    CHECK(cfg.target_sell_ratio == Approx(0.8));
    CHECK(cfg.velocity_window_hours == 48);
    CHECK(cfg.brake_threshold == Approx(2.0));
    CHECK(cfg.scenarios.optimistic == Approx(1.5));
    CHECK(cfg.bundle_gain_threshold == Approx(10000));
    CHECK(cfg.opportunity_score == Approx(0.9));

    // untouched keys keep their defaults
    CHECK(cfg.brake_strength_pct == Approx(0.05));
    CHECK(cfg.scenarios.pessimistic == Approx(0.7));
    CHECK(cfg.cannibalization_base_rate == Approx(0.15));
}

TEST_CASE("Malformed values keep the default", "[config]") {
    std::istringstream in(
        "[pricing]\n"
        "max_markup_pct = lots\n"
        "default_horizon_days = 12.5\n"
        "max_discount_pct = 0.2\n"
    );

    ConfigLoader loader;
    REQUIRE(loader.loadFromStream(in));

    EngineConfig cfg = loader.toConfig();
    CHECK(cfg.max_markup_pct == Approx(0.50));
    CHECK(cfg.default_horizon_days == 90);
    CHECK(cfg.max_discount_pct == Approx(0.2));
}

TEST_CASE("Typed getters", "[config]") {
    std::istringstream in(
        "[x]\n"
        "count = 7\n"
        "name = north wing\n"
    );

    ConfigLoader loader;
    REQUIRE(loader.loadFromStream(in));

    CHECK(loader.getInt("x", "count") == 7);
    CHECK(loader.getInt("x", "missing", 3) == 3);
    CHECK(loader.get("x", "name") == "north wing");
    CHECK(loader.get("y", "count").empty());
}

TEST_CASE("Missing file reports false", "[config]") {
    ConfigLoader loader;
    CHECK_FALSE(loader.load("no_such_yieldcraft_config.ini"));
    EngineConfig cfg = loader.toConfig();
    CHECK(cfg.brake_threshold == Approx(1.5));
}
