#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "yieldcraft/analytics/OperatorAlerts.hpp"
#include "yieldcraft/analytics/RevenueMetrics.hpp"
#include "yieldcraft/bundle/BundleOptimizer.hpp"
#include "yieldcraft/bundle/PackageCatalog.hpp"
#include "yieldcraft/forecast/DemandForecaster.hpp"
#include "yieldcraft/pricing/PricingCalculator.hpp"
#include "yieldcraft/sim/SalesSimulator.hpp"

namespace yieldcraft {

// "YYYY-MM-DD"
Date parseDate(const std::string& text);
std::string formatDate(const Date& date);

// "YYYY-MM-DDTHH:MM:SS" (a space separator is accepted too)
Timestamp parseTimestamp(const std::string& text);
std::string formatTimestamp(const Timestamp& ts);

// Inputs
void to_json(nlohmann::json& j, const InventoryUnit& unit);
void from_json(const nlohmann::json& j, InventoryUnit& unit);
void to_json(nlohmann::json& j, const BookingEvent& event);
void from_json(const nlohmann::json& j, BookingEvent& event);

// Results
void to_json(nlohmann::json& j, const PriceFactor& factor);
void to_json(nlohmann::json& j, const WaterfallStep& step);
void to_json(nlohmann::json& j, const PricingResult& result);
void to_json(nlohmann::json& j, const ForecastResult& result);
void to_json(nlohmann::json& j, const DemandForecast& forecast);
void to_json(nlohmann::json& j, const PortfolioForecast& summary);
void to_json(nlohmann::json& j, const BundlePackage& pkg);
void to_json(nlohmann::json& j, const SimulationLeg& leg);
void to_json(nlohmann::json& j, const SimulationDay& day);
void to_json(nlohmann::json& j, const SimulationResult& result);
void to_json(nlohmann::json& j, const BundleRecommendation& rec);
void to_json(nlohmann::json& j, const StandaloneAdvice& advice);
void to_json(nlohmann::json& j, const ExcludedUnit& unit);
void to_json(nlohmann::json& j, const OptimizationReport& report);
void to_json(nlohmann::json& j, const DailyRevenue& day);
void to_json(nlohmann::json& j, const RoiSummary& roi);
void to_json(nlohmann::json& j, const RescueSummary& rescue);
void to_json(nlohmann::json& j, const OperatorAlert& alert);

// Inventory file: JSON array of units. Throws std::runtime_error naming the file.
std::vector<InventoryUnit> loadInventory(const std::string& path);
void saveInventory(const std::string& path, const std::vector<InventoryUnit>& units);

}
