#pragma once

#include <string>
#include <vector>

#include "yieldcraft/bundle/PackageCatalog.hpp"

namespace yieldcraft {

enum class AlertLevel : uint8_t {
    Info,
    Warning,
    Danger
};

const char* toString(AlertLevel level);

struct OperatorAlert {
    AlertLevel level = AlertLevel::Info;
    uint64_t unit_id = 0;         // 0 for portfolio-level alerts
    std::string title;
    std::string message;
};

// pricing_results and units are matched by unit id.
std::vector<OperatorAlert> buildAlerts(
    const std::vector<PricingResult>& pricing_results,
    const std::vector<InventoryUnit>& units,
    const std::vector<BundlePackage>& packages,
    const EngineConfig& cfg
);

}
