#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <nlohmann/json.hpp>

#include "yieldcraft/analytics/RevenueMetrics.hpp"
#include "yieldcraft/audit/EventJournal.hpp"
#include "yieldcraft/audit/PriceHistoryLog.hpp"
#include "yieldcraft/config/ConfigLoader.hpp"
#include "yieldcraft/core/Format.hpp"
#include "yieldcraft/engine/DecisionEngine.hpp"
#include "yieldcraft/inventory/MemoryInventoryRepository.hpp"
#include "yieldcraft/io/JsonCodec.hpp"

using json = nlohmann::json;
using namespace yieldcraft;

namespace {

struct Options {
    std::string config_path = "config.ini";
    std::string inventory_path = "data/sample_inventory.json";
    std::string events_path = "data/sample_events.jsonl";
    std::string at;
    Scenario scenario = Scenario::Base;
    PricingStrategy strategy = PricingStrategy::RuleBased;
    bool as_json = false;

    std::string command;
    std::vector<std::string> args;
};

void usage() {
    std::cerr
        << "Usage: yieldcraft [options] <command> [args]\n"
        << "\n"
        << "Options:\n"
        << "  --config F        INI file (default config.ini)\n"
        << "  --inventory F     inventory JSON (default data/sample_inventory.json)\n"
        << "  --events F        booking journal JSONL (default data/sample_events.jsonl)\n"
        << "  --at TS           reference time YYYY-MM-DDTHH:MM:SS (default now)\n"
        << "  --scenario S      pessimistic | base | optimistic\n"
        << "  --strategy S      rule | elasticity\n"
        << "  --json            machine-readable output\n"
        << "\n"
        << "Commands:\n"
        << "  config\n"
        << "  price\n"
        << "  forecast\n"
        << "  packages\n"
        << "  recommend\n"
        << "  simulate <hotel> <flight> [discount] [horizon]\n"
        << "  metrics\n"
        << "  alerts\n"
        << "  snapshot <history.jsonl>\n"
        << "  sell <unit> <qty> <price> [partner] [discount]\n";
}

Options parseArgs(int argc, char** argv) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string(flag) + " needs a value");
            }
            return argv[++i];
        };

        if (a == "--config") {
            opt.config_path = next("--config");
        } else if (a == "--inventory") {
            opt.inventory_path = next("--inventory");
        } else if (a == "--events") {
            opt.events_path = next("--events");
        } else if (a == "--at") {
            opt.at = next("--at");
        } else if (a == "--scenario") {
            std::string s = next("--scenario");
            std::optional<Scenario> sc = parseScenario(s);
            if (!sc) throw std::invalid_argument("unknown scenario: " + s);
            opt.scenario = *sc;
        } else if (a == "--strategy") {
            std::string s = next("--strategy");
            std::optional<PricingStrategy> st = parsePricingStrategy(s);
            if (!st) throw std::invalid_argument("unknown strategy: " + s);
            opt.strategy = *st;
        } else if (a == "--json") {
            opt.as_json = true;
        } else if (a == "-h" || a == "--help") {
            opt.command = "help";
        } else if (opt.command.empty()) {
            opt.command = a;
        } else {
            opt.args.push_back(a);
        }
    }
    return opt;
}

uint64_t parseId(const std::string& text) {
    return std::stoull(text);
}

const InventoryUnit& findUnit(const std::vector<InventoryUnit>& units, uint64_t id) {
    for (const auto& u : units) {
        if (u.id == id) return u;
    }
    throw std::invalid_argument("unknown unit id " + std::to_string(id));
}

std::string leadText(const std::optional<int>& lead) {
    return lead ? std::to_string(*lead) + "d" : "n/a";
}

std::string velocityText(const VelocityRatio& v) {
    return v ? formatFixed(*v, 2) + "x" : "no signal";
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmdPrice(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
             const Timestamp& at, const Options& opt) {
    std::vector<PricingResult> results = engine.priceAll(units, at, opt.strategy);

    if (opt.as_json) {
        std::cout << json(results).dump(2) << "\n";
        return 0;
    }

    for (size_t i = 0; i < results.size(); ++i) {
        const PricingResult& r = results[i];
        std::cout << "#" << r.unit_id << " " << r.name
                  << "  base " << formatAmount(r.base_price)
                  << " -> " << formatAmount(r.final_price)
                  << "  [" << toString(units[i].availability())
                  << ", " << toString(r.strategy) << ", lead " << leadText(r.lead_days)
                  << ", velocity " << velocityText(r.velocity_ratio)
                  << (r.is_brake_active ? ", BRAKE" : "") << "]\n";
        for (const auto& f : r.factors) {
            std::cout << "    " << std::left << std::setw(18) << f.label
                      << std::right << std::setw(10) << formatSignedAmount(f.amount)
                      << "  " << f.reason << "\n";
        }
    }
    return 0;
}

int cmdForecast(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
                const Timestamp& at, const Options& opt) {
    std::vector<DemandForecast> forecasts;
    forecasts.reserve(units.size());
    for (const auto& u : units) {
        forecasts.push_back(engine.forecast(u, at));
    }
    PortfolioForecast summary = engine.summarize(units, opt.scenario, at);

    if (opt.as_json) {
        std::cout << json{{"units", forecasts}, {"summary", summary}}.dump(2) << "\n";
        return 0;
    }

    for (const auto& f : forecasts) {
        std::cout << "#" << f.unit_id << "  lead " << leadText(f.lead_days)
                  << "  pace " << formatFixed(f.baseline_pace, 2) << "/day ("
                  << toString(f.source) << ")\n";
        for (const auto& kv : f.scenarios) {
            const ForecastResult& r = kv.second;
            std::cout << "    " << std::left << std::setw(12) << toString(r.scenario)
                      << std::right
                      << " sold " << std::setw(7) << formatFixed(r.predicted_sold, 1)
                      << " unsold " << std::setw(7) << formatFixed(r.predicted_unsold, 1)
                      << " net " << formatSignedAmount(r.expected_profit) << "\n";
        }
    }
    std::cout << "\nPortfolio (" << toString(summary.scenario) << "): net "
              << formatSignedAmount(summary.expected_profit) << ", unsold "
              << formatFixed(summary.unsold_units, 1) << ", write-off risk "
              << toString(summary.risk) << "\n";
    return 0;
}

int cmdPackages(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
                const Timestamp& at, const Options& opt) {
    std::vector<BundlePackage> pkgs = engine.packages(units, at);

    if (opt.as_json) {
        std::cout << json(pkgs).dump(2) << "\n";
        return 0;
    }

    for (const auto& p : pkgs) {
        std::cout << std::setw(3) << p.rank << ". " << p.flight_name << " + " << p.hotel_name
                  << "  " << formatAmount(p.final_price)
                  << " (discount " << formatSignedAmount(p.discount)
                  << ", score " << formatFixed(p.strategy_score, 2) << ")\n"
                  << "     " << p.justification << "\n";
    }
    return 0;
}

int cmdRecommend(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
                 const Timestamp& at, const Options& opt) {
    OptimizationReport report = engine.recommend(units, opt.scenario, at);

    if (opt.as_json) {
        std::cout << json(report).dump(2) << "\n";
        return 0;
    }

    std::cout << "Bundles:\n";
    if (report.recommendations.empty()) {
        std::cout << "  none above threshold\n";
    }
    for (const auto& r : report.recommendations) {
        std::cout << "  " << r.reason << "\n";
    }
    std::cout << "Standalone:\n";
    for (const auto& s : report.standalone) {
        std::cout << "  #" << s.unit_id << " " << s.name << ": " << s.advice << "\n";
    }
    for (const auto& x : report.excluded) {
        std::cout << "  #" << x.unit_id << " " << x.name << ": skipped, " << x.reason << "\n";
    }
    std::cout << "\nStandalone total " << formatSignedAmount(report.standalone_total)
              << ", optimized " << formatSignedAmount(report.optimized_total)
              << ", uplift " << formatSignedAmount(report.uplift) << "\n";
    return 0;
}

int cmdSimulate(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
                const Timestamp& at, const Options& opt) {
    if (opt.args.size() < 2) {
        throw std::invalid_argument("simulate needs <hotel> <flight>");
    }

    const InventoryUnit& a = findUnit(units, parseId(opt.args[0]));
    const InventoryUnit& b = findUnit(units, parseId(opt.args[1]));

    double discount = 0.0;
    if (opt.args.size() > 2) {
        discount = std::stod(opt.args[2]);
    } else {
        double combined =
            engine.price(a, at).final_price +
            engine.price(b, at).final_price;
        discount = roundToUnit(
            engine.configuration().bundle_discount_rate * combined,
            engine.configuration().price_unit
        );
    }

    int horizon = 0;
    if (opt.args.size() > 3) {
        horizon = std::stoi(opt.args[3]);
    } else {
        const InventoryUnit& hotel = a.kind == UnitKind::Hotel ? a : b;
        horizon = hotel.leadDays(at).value_or(engine.configuration().default_horizon_days);
    }

    std::optional<SimulationResult> sim =
        engine.simulate(a, b, discount, horizon, opt.scenario, at);
    if (!sim) {
        throw std::invalid_argument("simulate needs one hotel and one flight");
    }

    if (opt.as_json) {
        std::cout << json(*sim).dump(2) << "\n";
        return 0;
    }

    std::cout << sim->hotel.name << " + " << sim->flight.name
              << ", discount " << formatAmount(sim->discount)
              << ", " << sim->horizon_days << " days, " << toString(sim->scenario) << "\n";
    std::cout << " day  decay   A.hotel A.flight   B.pkg  B.hotel B.flight\n";
    for (const auto& d : sim->trace) {
        std::cout << std::setw(4) << d.day
                  << std::setw(7) << formatFixed(d.decay, 3)
                  << std::setw(10) << d.a_hotel_stock
                  << std::setw(9) << d.a_flight_stock
                  << std::setw(8) << d.b_packages
                  << std::setw(9) << d.b_hotel_stock
                  << std::setw(9) << d.b_flight_stock << "\n";
    }
    std::cout << "\nSeparate: " << formatSignedAmount(sim->profit_a)
              << "  Bundled: " << formatSignedAmount(sim->profit_b)
              << "  Gain: " << formatSignedAmount(sim->gain)
              << "  Packages: " << sim->packages_sold << "\n";
    return 0;
}

int cmdMetrics(const MemoryInventoryRepository& repo, const std::vector<InventoryUnit>& units,
               const Timestamp& at, const Options& opt) {
    std::vector<BookingEvent> events =
        repo.eventsBetween(Timestamp(boost::posix_time::min_date_time), at);

    RoiSummary roi = computeRoi(events);
    RescueSummary rescue = computeRescue(events, units);

    if (opt.as_json) {
        std::cout << json{{"roi", roi}, {"rescue", rescue}}.dump(2) << "\n";
        return 0;
    }

    std::cout << "Dynamic revenue " << formatAmount(roi.dynamic_revenue)
              << " vs fixed " << formatAmount(roi.fixed_revenue)
              << ": lift " << formatSignedAmount(roi.lift)
              << " (" << formatFixed(roi.lift_pct, 1) << "%) over "
              << roi.units_sold << " units\n";
    for (const auto& d : roi.daily) {
        std::cout << "  " << formatDate(d.date)
                  << "  " << std::setw(12) << formatAmount(d.dynamic_revenue)
                  << "  " << std::setw(12) << formatAmount(d.fixed_revenue) << "\n";
    }
    std::cout << "Bundle rescue " << formatFixed(rescue.rescue_rate_pct, 1) << "% ("
              << rescue.rescued_units << "/" << rescue.total_units << "), hotels "
              << formatFixed(rescue.hotel_rescue_rate_pct, 1) << "%\n";
    return 0;
}

int cmdAlerts(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
              const Timestamp& at, const Options& opt) {
    std::vector<OperatorAlert> alerts = engine.alerts(units, at);

    if (opt.as_json) {
        std::cout << json(alerts).dump(2) << "\n";
        return 0;
    }

    if (alerts.empty()) {
        std::cout << "No alerts\n";
    }
    for (const auto& a : alerts) {
        std::cout << "[" << toString(a.level) << "] " << a.title << ": " << a.message << "\n";
    }
    return 0;
}

int cmdSnapshot(const DecisionEngine& engine, const std::vector<InventoryUnit>& units,
                const Timestamp& at, const Options& opt) {
    if (opt.args.empty()) {
        throw std::invalid_argument("snapshot needs <history.jsonl>");
    }

    PriceHistoryLog history(opt.args[0]);
    for (const auto& u : units) {
        history.record(engine.price(u, at, opt.strategy), u.remaining_stock, at);
    }
    std::cout << "[YIELDCRAFT] Recorded " << history.written() << " prices to "
              << opt.args[0] << "\n";
    return 0;
}

int cmdSell(DecisionEngine& engine, MemoryInventoryRepository& repo,
            const std::vector<InventoryUnit>& units, const Timestamp& at, const Options& opt) {
    if (opt.args.size() < 3) {
        throw std::invalid_argument("sell needs <unit> <qty> <price>");
    }

    const InventoryUnit& unit = findUnit(units, parseId(opt.args[0]));
    int qty = std::stoi(opt.args[1]);
    if (qty <= 0) {
        throw std::invalid_argument("quantity must be positive");
    }
    if (qty > unit.remaining_stock) {
        throw std::invalid_argument(
            "only " + std::to_string(unit.remaining_stock) + " left for unit " +
            std::to_string(unit.id));
    }

    BookingEvent e;
    e.unit_id = unit.id;
    e.booked_at = at;
    e.quantity = qty;
    e.sold_price = std::stod(opt.args[2]);
    e.base_price_at_sale = unit.base_price;
    if (opt.args.size() > 3) {
        e.partner_id = parseId(opt.args[3]);
        e.is_bundle = true;
    }
    if (opt.args.size() > 4) {
        e.discount_amount = std::stod(opt.args[4]);
    }

    // The journal is the record of sales. If the inventory rewrite below fails,
    // the stock file lags the journal and the error exits non-zero.
    EventJournal journal(opt.events_path);
    repo.attachJournal(&journal);
    engine.recordSale(e);
    repo.attachJournal(nullptr);

    repo.setRemaining(unit.id, unit.remaining_stock - qty);
    saveInventory(opt.inventory_path, repo.fetchSnapshot(at));

    std::cout << "[YIELDCRAFT] Sold " << qty << " x #" << unit.id << " at "
              << formatAmount(e.sold_price) << ", " << (unit.remaining_stock - qty)
              << " left, logged to " << journal.path() << "\n";
    return 0;
}

int run(int argc, char** argv) {
    Options opt = parseArgs(argc, argv);
    if (opt.command.empty() || opt.command == "help") {
        usage();
        return opt.command.empty() ? 1 : 0;
    }

    ConfigLoader loader;
    EngineConfig cfg;
    if (loader.load(opt.config_path)) {
        loader.applyTo(cfg);
        std::cerr << "[CONFIG] Loaded " << loader.getConfigPath() << "\n";
    }
    if (opt.command == "config") {
        loader.dump();
        return 0;
    }

    Timestamp at =
        opt.at.empty()
            ? boost::posix_time::second_clock::local_time()
            : parseTimestamp(opt.at);

    MemoryInventoryRepository repo(
        loadInventory(opt.inventory_path),
        EventJournal::readAll(opt.events_path)
    );
    std::cerr << "[REPO] " << repo.unitCount() << " units, "
              << repo.allEvents().size() << " events\n";

    DecisionEngine engine(repo, cfg);
    std::vector<InventoryUnit> units = engine.snapshot(at);

    if (opt.command == "price")     return cmdPrice(engine, units, at, opt);
    if (opt.command == "forecast")  return cmdForecast(engine, units, at, opt);
    if (opt.command == "packages")  return cmdPackages(engine, units, at, opt);
    if (opt.command == "recommend") return cmdRecommend(engine, units, at, opt);
    if (opt.command == "simulate")  return cmdSimulate(engine, units, at, opt);
    if (opt.command == "metrics")   return cmdMetrics(repo, units, at, opt);
    if (opt.command == "alerts")    return cmdAlerts(engine, units, at, opt);
    if (opt.command == "snapshot")  return cmdSnapshot(engine, units, at, opt);
    if (opt.command == "sell")      return cmdSell(engine, repo, units, at, opt);

    std::cerr << "[YIELDCRAFT] Unknown command: " << opt.command << "\n";
    usage();
    return 1;
}

}

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[YIELDCRAFT] ERROR: " << e.what() << "\n";
        return 1;
    }
}
