#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "yieldcraft/audit/EventJournal.hpp"
#include "yieldcraft/engine/DecisionEngine.hpp"
#include "yieldcraft/inventory/MemoryInventoryRepository.hpp"

using namespace yieldcraft;
using namespace yieldcraft::testing;
using boost::posix_time::hours;

namespace {

MemoryInventoryRepository sampleRepository() {
    return MemoryInventoryRepository(
        {
            makeFlight(1, 40, 10, 300000, 20),
            makeHotel(2, 20, 18, 400000, 20),
            makeHotel(3, 20, 10, 200000, std::nullopt)
        },
        {}
    );
}

}

TEST_CASE("Engine prices through both strategies", "[engine]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo = sampleRepository();
    DecisionEngine engine(repo, EngineConfig{});

    std::vector<InventoryUnit> units = engine.snapshot(ref);
    REQUIRE(units.size() == 3);

    PricingResult rule = engine.price(units[0], ref);
    CHECK(rule.strategy == PricingStrategy::RuleBased);

    PricingResult elastic = engine.price(units[0], ref, PricingStrategy::DemandElasticity);
    CHECK(elastic.strategy == PricingStrategy::DemandElasticity);
    CHECK(elastic.factor("decay") != nullptr);

    CHECK(engine.priceAll(units, ref).size() == 3);
}

TEST_CASE("Per-call configuration override", "[engine]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo = sampleRepository();
    DecisionEngine engine(repo, EngineConfig{});

    // flight 25% left, 20 days out: +10% pressure, +10% peak
    InventoryUnit flight = engine.snapshot(ref)[0];
    CHECK(engine.price(flight, ref).final_price == 360000);

    EngineConfig tight;
    tight.max_markup_pct = 0.05;
    CHECK(engine.price(flight, tight, ref).final_price == 315000);

    // the engine's own configuration is unchanged
    CHECK(engine.price(flight, ref).final_price == 360000);
}

TEST_CASE("Simulate accepts the pair in either order", "[engine]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo = sampleRepository();
    DecisionEngine engine(repo, EngineConfig{});
    std::vector<InventoryUnit> units = engine.snapshot(ref);

    auto a = engine.simulate(units[1], units[0], 20000, 20, Scenario::Base, ref);
    auto b = engine.simulate(units[0], units[1], 20000, 20, Scenario::Base, ref);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->hotel.unit_id == 2);
    CHECK(b->hotel.unit_id == 2);
    CHECK(a->gain == b->gain);

    CHECK_FALSE(engine.simulate(units[1], units[2], 0, 10, Scenario::Base, ref).has_value());
}

TEST_CASE("Recorded sales feed the velocity signal", "[engine]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo = sampleRepository();
    DecisionEngine engine(repo, EngineConfig{});
    InventoryUnit flight = engine.snapshot(ref)[0];

    CHECK_FALSE(engine.price(flight, ref).velocity_ratio.has_value());

    // expected 40 * 0.9 / 20 = 1.8/day; 4 sold today -> 2.222x
    engine.recordSale(makeSale(1, 4, ref - hours(1), 330000));
    REQUIRE(repo.allEvents().size() == 1);

    PricingResult r = engine.price(flight, ref);
    REQUIRE(r.velocity_ratio.has_value());
    CHECK(*r.velocity_ratio == Approx(2.222));
    CHECK(r.is_brake_active);
}

TEST_CASE("Engine forecasts, ranks and recommends", "[engine]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo = sampleRepository();
    DecisionEngine engine(repo, EngineConfig{});
    std::vector<InventoryUnit> units = engine.snapshot(ref);

    CHECK(engine.forecast(units[1], ref).scenarios.size() == 3);
    CHECK(engine.summarize(units, Scenario::Pessimistic, ref).units == 3);
    CHECK(engine.packages(units, ref).size() == 2);

    OptimizationReport report = engine.recommend(units, Scenario::Base, ref);
    REQUIRE(report.excluded.size() == 1);
    CHECK(report.excluded[0].unit_id == 3);
    CHECK(report.candidates == 1);
}

TEST_CASE("Repository keeps units and filters the event window", "[engine][repo]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo;
    repo.addUnit(makeHotel(1, 20, 2, 100000, 10));
    repo.addUnit(makeFlight(2, 20, 0, 100000, 10));
    repo.append(makeSale(1, 3, ref - hours(48)));
    repo.append(makeSale(2, 1, ref - hours(2)));
    repo.append(makeSale(2, 4, ref + hours(2)));

    std::vector<InventoryUnit> units = repo.fetchSnapshot(ref);
    REQUIRE(units.size() == 2);
    CHECK(units[0].availability() == Availability::LastFew);
    CHECK(units[1].availability() == Availability::SoldOut);

    CHECK(repo.eventsBetween(ref - hours(24), ref).size() == 1);
    CHECK(repo.eventsBetween(Timestamp(boost::posix_time::min_date_time), ref).size() == 2);
    CHECK(repo.sumQuantity(2, ref - hours(24), ref + hours(24)) == 5);

    repo.setRemaining(1, 50);
    CHECK(repo.fetchSnapshot(ref)[0].remaining_stock == 20);
    repo.setRemaining(1, -3);
    CHECK(repo.fetchSnapshot(ref)[0].remaining_stock == 0);

    InventoryUnit broken = makeHotel(3, 0, 0, 100000, 10);
    broken.total_stock = -4;
    repo.addUnit(broken);
    repo.setRemaining(3, 2);
    CHECK(repo.fetchSnapshot(ref)[2].remaining_stock == 0);
}

TEST_CASE("Failed journal write leaves the event log unchanged", "[engine][repo]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo;
    EventJournal journal(tempPath("missing_dir") + "/events.jsonl");
    repo.attachJournal(&journal);

    CHECK_THROWS_AS(repo.append(makeSale(1, 2, ref - hours(1))), std::runtime_error);
    CHECK(repo.eventsBetween(ref - hours(24), ref).empty());
    CHECK(repo.sumQuantity(1, ref - hours(24), ref) == 0);

    repo.attachJournal(nullptr);
    repo.append(makeSale(1, 2, ref - hours(1)));
    CHECK(repo.sumQuantity(1, ref - hours(24), ref) == 2);
}
