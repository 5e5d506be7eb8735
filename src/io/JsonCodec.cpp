#include "yieldcraft/io/JsonCodec.hpp"

#include <fstream>
#include <stdexcept>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

using json = nlohmann::json;

namespace yieldcraft {

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& v) {
    if (!v) return nullptr;
    return json(*v);
}

template <typename T>
std::optional<T> optionalFrom(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

std::optional<Date> optionalDate(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return parseDate(it->get<std::string>());
}

}

Date parseDate(const std::string& text) {
    Date d = boost::gregorian::from_simple_string(text);
    if (d.is_special()) {
        throw std::runtime_error("invalid date: " + text);
    }
    return d;
}

std::string formatDate(const Date& date) {
    return boost::gregorian::to_iso_extended_string(date);
}

Timestamp parseTimestamp(const std::string& text) {
    if (text.size() == 10) {
        return Timestamp(parseDate(text));
    }

    Timestamp ts =
        text.find('T') != std::string::npos
            ? boost::posix_time::from_iso_extended_string(text)
            : boost::posix_time::time_from_string(text);
    if (ts.is_special()) {
        throw std::runtime_error("invalid timestamp: " + text);
    }
    return ts;
}

std::string formatTimestamp(const Timestamp& ts) {
    return boost::posix_time::to_iso_extended_string(ts);
}

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------

void to_json(json& j, const InventoryUnit& unit) {
    j = json{
        {"id", unit.id},
        {"kind", toString(unit.kind)},
        {"name", unit.name},
        {"total_stock", unit.total_stock},
        {"remaining_stock", unit.remaining_stock},
        {"base_price", unit.base_price},
        {"elasticity", unit.elasticity}
    };
    if (unit.departure_date) j["departure_date"] = formatDate(*unit.departure_date);
    if (unit.procurement_date) j["procurement_date"] = formatDate(*unit.procurement_date);
    if (unit.unit_cost) j["unit_cost"] = *unit.unit_cost;
}

void from_json(const json& j, InventoryUnit& unit) {
    unit.id = j.at("id").get<uint64_t>();

    std::string kind = j.at("kind").get<std::string>();
    std::optional<UnitKind> k = parseUnitKind(kind);
    if (!k) {
        throw std::runtime_error("unit " + std::to_string(unit.id) + ": unknown kind '" + kind + "'");
    }
    unit.kind = *k;

    unit.name = j.value("name", std::string());
    unit.total_stock = j.at("total_stock").get<int>();
    unit.remaining_stock = j.at("remaining_stock").get<int>();
    if (unit.total_stock < 0 ||
        unit.remaining_stock < 0 ||
        unit.remaining_stock > unit.total_stock) {
        throw std::runtime_error(
            "unit " + std::to_string(unit.id) + ": remaining_stock " +
            std::to_string(unit.remaining_stock) + " out of range [0, " +
            std::to_string(unit.total_stock) + "]");
    }
    unit.base_price = j.at("base_price").get<double>();
    unit.elasticity = j.value("elasticity", -1.5);
    unit.departure_date = optionalDate(j, "departure_date");
    unit.procurement_date = optionalDate(j, "procurement_date");
    unit.unit_cost = optionalFrom<double>(j, "unit_cost");
}

void to_json(json& j, const BookingEvent& event) {
    j = json{
        {"unit_id", event.unit_id},
        {"partner_id", optionalToJson(event.partner_id)},
        {"booked_at", formatTimestamp(event.booked_at)},
        {"quantity", event.quantity},
        {"sold_price", event.sold_price},
        {"base_price_at_sale", event.base_price_at_sale},
        {"is_bundle", event.is_bundle},
        {"discount_amount", event.discount_amount}
    };
}

void from_json(const json& j, BookingEvent& event) {
    event.unit_id = j.at("unit_id").get<uint64_t>();
    event.partner_id = optionalFrom<uint64_t>(j, "partner_id");
    event.booked_at = parseTimestamp(j.at("booked_at").get<std::string>());
    event.quantity = j.value("quantity", 1);
    event.sold_price = j.at("sold_price").get<double>();
    event.base_price_at_sale = j.value("base_price_at_sale", event.sold_price);
    event.is_bundle = j.value("is_bundle", false);
    event.discount_amount = j.value("discount_amount", 0.0);
}

// ---------------------------------------------------------------------------
// Pricing
// ---------------------------------------------------------------------------

void to_json(json& j, const PriceFactor& factor) {
    j = json{
        {"label", factor.label},
        {"amount", factor.amount},
        {"applicable", factor.applicable},
        {"engaged", factor.engaged},
        {"reason", factor.reason}
    };
}

void to_json(json& j, const WaterfallStep& step) {
    j = json{
        {"label", step.label},
        {"value", step.value},
        {"kind", toString(step.kind)}
    };
}

void to_json(json& j, const PricingResult& result) {
    j = json{
        {"unit_id", result.unit_id},
        {"name", result.name},
        {"strategy", toString(result.strategy)},
        {"base_price", result.base_price},
        {"factors", result.factors},
        {"theoretical_price", result.theoretical_price},
        {"final_price", result.final_price},
        {"inventory_ratio", result.inventory_ratio},
        {"lead_days", optionalToJson(result.lead_days)},
        {"velocity_ratio", optionalToJson(result.velocity_ratio)},
        {"is_brake_active", result.is_brake_active},
        {"justification", result.justification},
        {"waterfall", result.waterfall}
    };
}

// ---------------------------------------------------------------------------
// Forecast
// ---------------------------------------------------------------------------

void to_json(json& j, const ForecastResult& result) {
    j = json{
        {"scenario", toString(result.scenario)},
        {"daily_pace", result.daily_pace},
        {"predicted_sold", result.predicted_sold},
        {"predicted_unsold", result.predicted_unsold},
        {"expected_profit", result.expected_profit}
    };
}

void to_json(json& j, const DemandForecast& forecast) {
    json scenarios = json::array();
    for (const auto& kv : forecast.scenarios) {
        scenarios.push_back(kv.second);
    }
    j = json{
        {"unit_id", forecast.unit_id},
        {"lead_days", optionalToJson(forecast.lead_days)},
        {"remaining_stock", forecast.remaining_stock},
        {"price", forecast.price},
        {"cost", forecast.cost},
        {"baseline_pace", forecast.baseline_pace},
        {"pace_source", toString(forecast.source)},
        {"scenarios", scenarios}
    };
}

void to_json(json& j, const PortfolioForecast& summary) {
    j = json{
        {"scenario", toString(summary.scenario)},
        {"expected_profit", summary.expected_profit},
        {"unsold_units", summary.unsold_units},
        {"write_off_risk", toString(summary.risk)},
        {"units", summary.units}
    };
}

// ---------------------------------------------------------------------------
// Bundling
// ---------------------------------------------------------------------------

void to_json(json& j, const BundlePackage& pkg) {
    j = json{
        {"rank", pkg.rank},
        {"flight_id", pkg.flight_id},
        {"hotel_id", pkg.hotel_id},
        {"flight_name", pkg.flight_name},
        {"hotel_name", pkg.hotel_name},
        {"flight_price", pkg.flight_price},
        {"hotel_price", pkg.hotel_price},
        {"discount", pkg.discount},
        {"final_price", pkg.final_price},
        {"urgency", pkg.urgency},
        {"urgency_label", pkg.urgency_label},
        {"strategy_score", pkg.strategy_score},
        {"flight_velocity", optionalToJson(pkg.flight_velocity)},
        {"hotel_velocity", optionalToJson(pkg.hotel_velocity)},
        {"justification", pkg.justification}
    };
}

void to_json(json& j, const SimulationLeg& leg) {
    j = json{
        {"unit_id", leg.unit_id},
        {"kind", toString(leg.kind)},
        {"name", leg.name},
        {"stock", leg.stock},
        {"price", leg.price},
        {"cost", leg.cost},
        {"pace", leg.pace},
        {"velocity_ratio", optionalToJson(leg.velocity_ratio)}
    };
}

void to_json(json& j, const SimulationDay& day) {
    j = json{
        {"day", day.day},
        {"decay", day.decay},
        {"a", {
            {"hotel_sold", day.a_hotel_sold},
            {"flight_sold", day.a_flight_sold},
            {"hotel_stock", day.a_hotel_stock},
            {"flight_stock", day.a_flight_stock},
            {"profit", day.a_profit},
            {"residual", day.a_residual}
        }},
        {"b", {
            {"packages", day.b_packages},
            {"hotel_sold", day.b_hotel_sold},
            {"flight_sold", day.b_flight_sold},
            {"hotel_stock", day.b_hotel_stock},
            {"flight_stock", day.b_flight_stock},
            {"profit", day.b_profit},
            {"residual", day.b_residual}
        }}
    };
}

void to_json(json& j, const SimulationResult& result) {
    j = json{
        {"hotel", result.hotel},
        {"flight", result.flight},
        {"scenario", toString(result.scenario)},
        {"horizon_days", result.horizon_days},
        {"discount", result.discount},
        {"package_pace", result.package_pace},
        {"cannibalization_rate", result.cannibalization_rate},
        {"cannibalization", result.cannibalization},
        {"package_profit", result.package_profit},
        {"profit_a", result.profit_a},
        {"profit_b", result.profit_b},
        {"gain", result.gain},
        {"packages_sold", result.packages_sold},
        {"write_off_a", result.write_off_a},
        {"write_off_b", result.write_off_b},
        {"trace", result.trace}
    };
}

void to_json(json& j, const BundleRecommendation& rec) {
    j = json{
        {"hotel_id", rec.hotel_id},
        {"flight_id", rec.flight_id},
        {"hotel_name", rec.hotel_name},
        {"flight_name", rec.flight_name},
        {"departure_date", formatDate(rec.departure_date)},
        {"discount", rec.discount},
        {"gain", rec.gain},
        {"packages_sold", rec.packages_sold},
        {"profit_a", rec.profit_a},
        {"profit_b", rec.profit_b},
        {"reason", rec.reason}
    };
}

void to_json(json& j, const StandaloneAdvice& advice) {
    j = json{
        {"unit_id", advice.unit_id},
        {"kind", toString(advice.kind)},
        {"name", advice.name},
        {"expected_profit", advice.expected_profit},
        {"advice", advice.advice}
    };
}

void to_json(json& j, const ExcludedUnit& unit) {
    j = json{
        {"unit_id", unit.unit_id},
        {"name", unit.name},
        {"reason", unit.reason}
    };
}

void to_json(json& j, const OptimizationReport& report) {
    j = json{
        {"scenario", toString(report.scenario)},
        {"recommendations", report.recommendations},
        {"standalone", report.standalone},
        {"excluded", report.excluded},
        {"candidates", report.candidates},
        {"standalone_total", report.standalone_total},
        {"optimized_total", report.optimized_total},
        {"uplift", report.uplift}
    };
}

// ---------------------------------------------------------------------------
// Analytics
// ---------------------------------------------------------------------------

void to_json(json& j, const DailyRevenue& day) {
    j = json{
        {"date", formatDate(day.date)},
        {"dynamic_revenue", day.dynamic_revenue},
        {"fixed_revenue", day.fixed_revenue}
    };
}

void to_json(json& j, const RoiSummary& roi) {
    j = json{
        {"dynamic_revenue", roi.dynamic_revenue},
        {"fixed_revenue", roi.fixed_revenue},
        {"lift", roi.lift},
        {"lift_pct", roi.lift_pct},
        {"units_sold", roi.units_sold},
        {"daily", roi.daily}
    };
}

void to_json(json& j, const RescueSummary& rescue) {
    j = json{
        {"rescue_rate_pct", rescue.rescue_rate_pct},
        {"rescued_units", rescue.rescued_units},
        {"total_units", rescue.total_units},
        {"hotel_rescue_rate_pct", rescue.hotel_rescue_rate_pct},
        {"hotel_rescued_units", rescue.hotel_rescued_units},
        {"hotel_units", rescue.hotel_units}
    };
}

void to_json(json& j, const OperatorAlert& alert) {
    j = json{
        {"level", toString(alert.level)},
        {"unit_id", alert.unit_id},
        {"title", alert.title},
        {"message", alert.message}
    };
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

std::vector<InventoryUnit> loadInventory(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open inventory file: " + path);
    }

    try {
        json doc = json::parse(in);
        if (!doc.is_array()) {
            throw std::runtime_error("expected a JSON array of units");
        }
        return doc.get<std::vector<InventoryUnit>>();
    } catch (const std::exception& e) {
        throw std::runtime_error(path + ": bad inventory: " + e.what());
    }
}

void saveInventory(const std::string& path, const std::vector<InventoryUnit>& units) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write inventory file: " + path);
    }
    out << json(units).dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("write failed: " + path);
    }
}

}
