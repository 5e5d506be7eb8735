#include <catch2/catch.hpp>

#include <fstream>

#include <nlohmann/json.hpp>

#include "TestFixtures.hpp"
#include "yieldcraft/audit/EventJournal.hpp"
#include "yieldcraft/audit/PriceHistoryLog.hpp"
#include "yieldcraft/io/JsonCodec.hpp"

using json = nlohmann::json;
using namespace yieldcraft;
using namespace yieldcraft::testing;

TEST_CASE("Units decode with optional fields", "[json]") {
    json j = json::parse(R"({
        "id": 7, "kind": "hotel", "name": "Harbor View 2N",
        "total_stock": 20, "remaining_stock": 12, "base_price": 180000,
        "departure_date": "2026-11-02", "unit_cost": 120000
    })");

    InventoryUnit u = j.get<InventoryUnit>();
    CHECK(u.id == 7);
    CHECK(u.kind == UnitKind::Hotel);
    CHECK(u.remaining_stock == 12);
    CHECK(u.elasticity == Approx(-1.5));
    REQUIRE(u.departure_date.has_value());
    CHECK(*u.departure_date == Date(2026, 11, 2));
    CHECK_FALSE(u.procurement_date.has_value());
    REQUIRE(u.unit_cost.has_value());
    CHECK(*u.unit_cost == 120000);

    json back = u;
    CHECK(back["kind"] == "hotel");
    CHECK(back["departure_date"] == "2026-11-02");
    CHECK_FALSE(back.contains("procurement_date"));
}

TEST_CASE("Unknown unit kind is rejected", "[json]") {
    json j = json::parse(R"({"id": 1, "kind": "cruise", "total_stock": 1,
                             "remaining_stock": 1, "base_price": 1})");
    CHECK_THROWS_AS(j.get<InventoryUnit>(), std::runtime_error);
}

TEST_CASE("Stock outside the snapshot range is rejected", "[json]") {
    SECTION("negative remaining") {
        json j = json::parse(R"({"id": 1, "kind": "hotel", "total_stock": 10,
                                 "remaining_stock": -5, "base_price": 10000})");
        CHECK_THROWS_WITH(j.get<InventoryUnit>(), Catch::Contains("out of range"));
    }
    SECTION("remaining above total") {
        json j = json::parse(R"({"id": 2, "kind": "flight", "total_stock": 10,
                                 "remaining_stock": 11, "base_price": 10000})");
        CHECK_THROWS_AS(j.get<InventoryUnit>(), std::runtime_error);
    }
    SECTION("negative total") {
        json j = json::parse(R"({"id": 3, "kind": "hotel", "total_stock": -1,
                                 "remaining_stock": 0, "base_price": 10000})");
        CHECK_THROWS_AS(j.get<InventoryUnit>(), std::runtime_error);
    }
    SECTION("bounds themselves are accepted") {
        json empty = json::parse(R"({"id": 4, "kind": "hotel", "total_stock": 10,
                                     "remaining_stock": 0, "base_price": 10000})");
        json full = json::parse(R"({"id": 5, "kind": "hotel", "total_stock": 10,
                                    "remaining_stock": 10, "base_price": 10000})");
        CHECK(empty.get<InventoryUnit>().remaining_stock == 0);
        CHECK(full.get<InventoryUnit>().remaining_stock == 10);
    }
}

TEST_CASE("Booking events carry ISO timestamps", "[json]") {
    json j = json::parse(R"({"unit_id": 3, "partner_id": 9, "booked_at": "2026-10-18T21:45:00",
                             "quantity": 2, "sold_price": 405000, "base_price_at_sale": 450000,
                             "is_bundle": true, "discount_amount": 45000})");

    BookingEvent e = j.get<BookingEvent>();
    CHECK(e.unit_id == 3);
    REQUIRE(e.partner_id.has_value());
    CHECK(*e.partner_id == 9);
    CHECK(e.booked_at == parseTimestamp("2026-10-18 21:45:00"));
    CHECK(e.is_bundle);

    json back = e;
    CHECK(back["booked_at"] == "2026-10-18T21:45:00");

    e.partner_id.reset();
    json solo = e;
    CHECK(solo["partner_id"].is_null());
}

TEST_CASE("Pricing results serialize velocity as null when absent", "[json]") {
    PricingResult r;
    r.unit_id = 4;
    r.final_price = 47500;
    r.factors.push_back({"scarcity", 5000, true, "pressure"});
    r.waterfall.push_back({"base_price", 50000, StepKind::Absolute});

    json j = r;
    CHECK(j["velocity_ratio"].is_null());
    CHECK(j["lead_days"].is_null());
    CHECK(j["factors"][0]["amount"] == 5000);
    CHECK(j["waterfall"][0]["kind"] == "absolute");
    CHECK(j["strategy"] == "rule_based");
}

TEST_CASE("Inventory file errors name the file", "[json]") {
    std::string missing = tempPath("missing_inventory");
    try {
        loadInventory(missing);
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).find(missing) != std::string::npos);
    }

    std::string bad = tempPath("bad_inventory");
    {
        std::ofstream out(bad);
        out << "{\"id\": 1}";
    }
    CHECK_THROWS_AS(loadInventory(bad), std::runtime_error);
}

TEST_CASE("Inventory survives a save and load", "[json]") {
    std::string path = tempPath("inventory");
    std::vector<InventoryUnit> units = {
        makeHotel(1, 10, 4, 50000, 12),
        makeFlight(2, 30, 30, 90000, std::nullopt)
    };

    saveInventory(path, units);
    std::vector<InventoryUnit> loaded = loadInventory(path);

    REQUIRE(loaded.size() == 2);
    CHECK(loaded[0].departure_date == units[0].departure_date);
    CHECK(loaded[1].kind == UnitKind::Flight);
    CHECK_FALSE(loaded[1].departure_date.has_value());
}

TEST_CASE("Event journal appends and reads back", "[json][journal]") {
    std::string path = tempPath("journal");
    const Timestamp ref = referenceTime();

    {
        EventJournal journal(path);
        REQUIRE(journal.isOpen());
        journal.append(makeSale(1, 2, ref, 10000));
        journal.append(makeSale(2, 1, ref, 20000));
        CHECK(journal.written() == 2);
    }
    {
        EventJournal journal(path);
        journal.append(makeSale(3, 5, ref, 30000));
    }

    std::vector<BookingEvent> events = EventJournal::readAll(path);
    REQUIRE(events.size() == 3);
    CHECK(events[0].unit_id == 1);
    CHECK(events[2].quantity == 5);
    CHECK(events[2].booked_at == ref);
}

TEST_CASE("Event journal reports the bad line", "[json][journal]") {
    std::string path = tempPath("bad_journal");
    {
        std::ofstream out(path);
        out << R"({"unit_id":1,"booked_at":"2026-10-18T10:00:00","sold_price":1})" << "\n";
        out << "not json\n";
    }

    try {
        EventJournal::readAll(path);
        FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).find(":2:") != std::string::npos);
    }

    CHECK(EventJournal::readAll(tempPath("absent_journal")).empty());
}

TEST_CASE("Price history records pricing passes", "[json][journal]") {
    std::string path = tempPath("history");
    const Timestamp ref = referenceTime();

    PricingResult r;
    r.unit_id = 8;
    r.final_price = 61200;
    r.lead_days = 14;

    {
        PriceHistoryLog log(path);
        log.record(r, 6, ref);
        r.lead_days.reset();
        log.record(r, 5, ref);
    }

    std::vector<PriceHistoryRow> rows = PriceHistoryLog::readAll(path);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].unit_id == 8);
    CHECK(rows[0].final_price == 61200);
    CHECK(rows[0].lead_days == 14);
    CHECK(rows[0].recorded_at == ref);
    CHECK_FALSE(rows[1].lead_days.has_value());
    CHECK(rows[1].remaining_stock == 5);
}
