#include <catch2/catch.hpp>

#include "TestFixtures.hpp"
#include "yieldcraft/bundle/PackageCatalog.hpp"
#include "yieldcraft/inventory/MemoryInventoryRepository.hpp"

using namespace yieldcraft;
using namespace yieldcraft::testing;

TEST_CASE("Catalog pairs every flight with every hotel", "[bundle][catalog]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo;
    PackageCatalog catalog(repo, EngineConfig{});

    std::vector<InventoryUnit> units = {
        makeFlight(1, 40, 10, 300000, 20),
        makeFlight(2, 40, 38, 250000, 20),
        makeHotel(3, 20, 19, 400000, 5),
        makeHotel(4, 20, 4, 200000, 60)
    };

    std::vector<BundlePackage> pkgs = catalog.build(units, ref);
    REQUIRE(pkgs.size() == 4);

    for (size_t i = 0; i < pkgs.size(); ++i) {
        CHECK(pkgs[i].rank == static_cast<int>(i + 1));
        CHECK(pkgs[i].final_price == Approx(pkgs[i].flight_price + pkgs[i].hotel_price + pkgs[i].discount));
        CHECK(pkgs[i].discount <= 0.0);
        if (i > 0) {
            CHECK(pkgs[i - 1].strategy_score >= pkgs[i].strategy_score);
        }
    }

    // urgent hotel with the busier flight ranks first
    CHECK(pkgs.front().hotel_id == 3);
    CHECK(pkgs.front().flight_id == 1);
    CHECK(pkgs.front().urgency_label == "critical");
    CHECK(pkgs.front().justification.find("critical") != std::string::npos);
}

TEST_CASE("Catalog is empty without both kinds", "[bundle][catalog]") {
    const Timestamp ref = referenceTime();
    MemoryInventoryRepository repo;
    PackageCatalog catalog(repo, EngineConfig{});

    CHECK(catalog.build({makeHotel(1, 10, 5, 1000, 10)}, ref).empty());
    CHECK(catalog.build({}, ref).empty());
}

TEST_CASE("Urgency labels", "[bundle][catalog]") {
    CHECK(std::string(urgencyLabel(0.95)) == "critical");
    CHECK(std::string(urgencyLabel(0.80)) == "critical");
    CHECK(std::string(urgencyLabel(0.60)) == "high");
    CHECK(std::string(urgencyLabel(0.40)) == "moderate");
    CHECK(std::string(urgencyLabel(0.39)) == "low");
}
