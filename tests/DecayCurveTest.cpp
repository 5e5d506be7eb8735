#include <catch2/catch.hpp>

#include "yieldcraft/pricing/DecayCurve.hpp"

using namespace yieldcraft;

TEST_CASE("Decay curve is normalized to the unit interval", "[decay]") {
    DecayCurve curve(20.0, 0.12);

    CHECK(curve.at(0.0) == Approx(0.0).margin(1e-12));
    CHECK(curve.at(1.0) == Approx(1.0));
    CHECK(curve.at(-0.5) == Approx(0.0).margin(1e-12));
    CHECK(curve.at(2.0) == Approx(1.0));
}

TEST_CASE("Decay is monotone in time left", "[decay]") {
    DecayCurve curve(20.0, 0.12);

    double prev = curve.at(0.0);
    for (int i = 1; i <= 100; ++i) {
        double v = curve.at(i / 100.0);
        CHECK(v >= prev);
        prev = v;
    }
    CHECK(curve.at(0.05) < 0.5);
    CHECK(curve.at(0.5) > 0.99);
}

TEST_CASE("Decay by lead days", "[decay]") {
    DecayCurve curve(20.0, 0.12);

    CHECK(curve.forLeadDays(0, 90) == 0.0);
    CHECK(curve.forLeadDays(-4, 90) == 0.0);
    CHECK(curve.forLeadDays(5, 0) == 1.0);
    CHECK(curve.forLeadDays(45, 90) == Approx(curve.at(0.5)));
}

TEST_CASE("Flat curve falls back to no decay", "[decay]") {
    DecayCurve flat(0.0, 0.12);
    CHECK(flat.at(0.3) == 1.0);
}
