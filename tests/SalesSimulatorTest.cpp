#include <catch2/catch.hpp>

#include <cmath>

#include "TestFixtures.hpp"
#include "yieldcraft/inventory/MemoryInventoryRepository.hpp"
#include "yieldcraft/sim/SalesSimulator.hpp"

using namespace yieldcraft;
using namespace yieldcraft::testing;

namespace {

SimulationLeg leg(UnitKind kind, int stock, double cost, double price, double pace) {
    SimulationLeg l;
    l.unit_id = kind == UnitKind::Hotel ? 1 : 2;
    l.kind = kind;
    l.stock = stock;
    l.cost = cost;
    l.price = price;
    l.pace = pace;
    return l;
}

}

TEST_CASE("Package run against separate sales", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg hotel = leg(UnitKind::Hotel, 10, 7000, 10000, 1.0);
    SimulationLeg flight = leg(UnitKind::Flight, 10, 5000, 9000, 1.0);

    SimulationResult r = sim.run(hotel, flight, 1000, 5, Scenario::Base);

    // package pace 1.0 * 1.5 * 1.1 draws 1, 2, 1, 2, 2
    CHECK(r.packages_sold == 8);
    CHECK(r.package_pace == Approx(1.65));
    CHECK(r.cannibalization_rate == Approx(0.15));
    CHECK(r.cannibalization == 600);
    CHECK(r.package_profit == 5400);

    CHECK(r.profit_a == -25000);
    CHECK(r.profit_b == 19200);
    CHECK(r.gain == 44200);
    CHECK(r.gain == std::round(r.gain));
    CHECK(r.packages_sold <= 10);
}

TEST_CASE("Trace covers every day down to the write-off", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg hotel = leg(UnitKind::Hotel, 10, 7000, 10000, 1.0);
    SimulationLeg flight = leg(UnitKind::Flight, 10, 5000, 9000, 1.3);
    SimulationResult r = sim.run(hotel, flight, 1000, 5, Scenario::Base);

    REQUIRE(r.trace.size() == 6);
    CHECK(r.trace.front().day == 5);
    CHECK(r.trace.back().day == 0);
    CHECK(r.trace.back().decay == 0.0);
    CHECK(r.trace.back().a_residual == 0.0);
    CHECK(r.trace.front().decay > 0.99);

    int hotel_sold = 0;
    int flight_sold = 0;
    for (const auto& d : r.trace) {
        hotel_sold += d.a_hotel_sold;
        flight_sold += d.a_flight_sold;
        CHECK(hotel_sold + d.a_hotel_stock == hotel.stock);
        CHECK(flight_sold + d.a_flight_stock == flight.stock);
        CHECK(d.b_hotel_stock >= 0);
        CHECK(d.b_flight_stock >= 0);
    }
}

TEST_CASE("Survivor leg sells alone once the partner is gone", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg hotel = leg(UnitKind::Hotel, 10, 7000, 10000, 1.0);
    SimulationLeg flight = leg(UnitKind::Flight, 2, 5000, 9000, 1.0);
    SimulationResult r = sim.run(hotel, flight, 0, 6, Scenario::Base);

    CHECK(r.packages_sold == 2);
    int hotel_alone = 0;
    for (const auto& d : r.trace) hotel_alone += d.b_hotel_sold;
    CHECK(hotel_alone > 0);
    CHECK(r.trace.back().b_flight_stock == 0);
    CHECK(r.trace.back().b_hotel_stock == 10 - 2 - hotel_alone);
}

TEST_CASE("Zero horizon only writes off", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg hotel = leg(UnitKind::Hotel, 4, 7000, 10000, 3.0);
    SimulationLeg flight = leg(UnitKind::Flight, 3, 5000, 9000, 3.0);
    SimulationResult r = sim.run(hotel, flight, 1000, 0, Scenario::Base);

    REQUIRE(r.trace.size() == 1);
    CHECK(r.packages_sold == 0);
    CHECK(r.profit_a == -(4 * 7000 + 3 * 5000));
    CHECK(r.profit_b == r.profit_a);
    CHECK(r.gain == 0);
}

TEST_CASE("Cannibalization follows the flight's velocity", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg flight = leg(UnitKind::Flight, 10, 5000, 9000, 1.0);
    CHECK(sim.cannibalizationRate(flight) == Approx(0.15));

    flight.velocity_ratio = 1.4;
    CHECK(sim.cannibalizationRate(flight) == Approx(0.4));

    flight.velocity_ratio = 0.6;
    CHECK(sim.cannibalizationRate(flight) == 0.0);

    flight.velocity_ratio = 1.4;
    SimulationLeg hotel = leg(UnitKind::Hotel, 10, 7000, 10000, 1.0);
    CHECK(sim.run(hotel, flight, 1000, 5, Scenario::Base).cannibalization == 1600);
}

TEST_CASE("Runs are deterministic", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg hotel = leg(UnitKind::Hotel, 37, 7000, 10000, 0.83);
    SimulationLeg flight = leg(UnitKind::Flight, 21, 5000, 9000, 1.17);

    SimulationResult a = sim.run(hotel, flight, 1500, 30, Scenario::Base);
    SimulationResult b = sim.run(hotel, flight, 1500, 30, Scenario::Base);
    CHECK(a.gain == b.gain);
    CHECK(a.packages_sold == b.packages_sold);
}

TEST_CASE("Standalone profit for a single leg", "[sim]") {
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    SimulationLeg hotel = leg(UnitKind::Hotel, 10, 7000, 10000, 1.0);
    CHECK(sim.standaloneProfit(hotel, 5) == -20000);
    CHECK(sim.standaloneProfit(hotel, 0) == -70000);
}

TEST_CASE("Legs are built from unit pricing and forecast", "[sim]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo;
    SalesSimulator sim(repo, EngineConfig{});

    InventoryUnit unit = makeHotel(1, 60, 60, 100000, 60);
    SimulationLeg l = sim.buildLeg(unit, Scenario::Optimistic, ref);

    CHECK(l.stock == 60);
    CHECK(l.cost == Approx(70000));
    CHECK(l.price == 85000);
    CHECK(l.pace == Approx(60 * 0.7 / 60 * 1.3));
    CHECK_FALSE(l.velocity_ratio.has_value());
}
