#include "yieldcraft/config/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace yieldcraft {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}

bool ConfigLoader::load(const std::string& path) {
    const char* home = std::getenv("HOME");
    std::vector<std::string> paths = {
        path,
        "../" + path,
        std::string(home ? home : ".") + "/.yieldcraft/" + path
    };

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            return parse(file);
        }
    }

    std::cerr << "[CONFIG] " << path << " not found, using defaults\n";
    std::cerr << "[CONFIG] Searched paths:\n";
    for (const auto& p : paths) {
        std::cerr << "  - " << p << "\n";
    }
    return false;
}

bool ConfigLoader::loadFromStream(std::istream& in) {
    configPath_ = "<stream>";
    return parse(in);
}

std::string ConfigLoader::get(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] " << section << "." << key << " = '" << val
                  << "' is not an integer (" << e.what() << "), keeping " << defaultVal << "\n";
        return defaultVal;
    }
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        double parsed = std::stod(val, &used);
        if (used != val.size()) throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] " << section << "." << key << " = '" << val
                  << "' is not a number (" << e.what() << "), keeping " << defaultVal << "\n";
        return defaultVal;
    }
}

void ConfigLoader::applyTo(EngineConfig& cfg) const {
    auto real = [this](const char* section, const char* key, double& field) {
        field = getDouble(section, key, field);
    };
    auto whole = [this](const char* section, const char* key, int& field) {
        field = getInt(section, key, field);
    };

    real("velocity", "target_sell_ratio", cfg.target_sell_ratio);
    whole("velocity", "window_hours", cfg.velocity_window_hours);

    real("pricing", "brake_threshold", cfg.brake_threshold);
    real("pricing", "brake_strength_pct", cfg.brake_strength_pct);
    real("pricing", "max_discount_pct", cfg.max_discount_pct);
    real("pricing", "max_markup_pct", cfg.max_markup_pct);
    real("pricing", "price_unit", cfg.price_unit);
    real("pricing", "elasticity_pace_floor", cfg.elasticity_pace_floor);
    real("pricing", "elasticity_pace_cap", cfg.elasticity_pace_cap);
    real("pricing", "decay_steepness", cfg.decay_steepness);
    real("pricing", "decay_midpoint", cfg.decay_midpoint);
    whole("pricing", "default_horizon_days", cfg.default_horizon_days);

    real("forecast", "pessimistic", cfg.scenarios.pessimistic);
    real("forecast", "base", cfg.scenarios.base);
    real("forecast", "optimistic", cfg.scenarios.optimistic);
    whole("forecast", "lookback_days", cfg.forecast_lookback_days);
    real("forecast", "theoretical_sell_ratio", cfg.theoretical_sell_ratio);
    whole("forecast", "theoretical_min_days", cfg.theoretical_min_days);
    real("forecast", "default_cost_ratio", cfg.default_cost_ratio);
    real("forecast", "unsold_risk_high", cfg.unsold_risk_high);
    real("forecast", "unsold_risk_medium", cfg.unsold_risk_medium);

    real("bundle", "velocity_boost", cfg.bundle_velocity_boost);
    real("bundle", "discount_rate", cfg.bundle_discount_rate);
    real("bundle", "gain_threshold", cfg.bundle_gain_threshold);
    real("bundle", "cannibalization_base_rate", cfg.cannibalization_base_rate);
    real("bundle", "reference_discount", cfg.reference_discount);
    real("bundle", "urgency_time_weight", cfg.urgency_time_weight);
    real("bundle", "urgency_horizon_days", cfg.urgency_horizon_days);
    real("bundle", "list_cap_pct", cfg.bundle_list_cap_pct);
    real("bundle", "dynamic_cap_pct", cfg.bundle_dynamic_cap_pct);
    real("bundle", "strategy_urgency_weight", cfg.strategy_urgency_weight);

    real("alerts", "slow_pace_ratio", cfg.slow_pace_ratio);
    real("alerts", "slow_pace_min_inventory", cfg.slow_pace_min_inventory);
    real("alerts", "opportunity_score", cfg.opportunity_score);
}

EngineConfig ConfigLoader::toConfig() const {
    EngineConfig cfg;
    applyTo(cfg);
    return cfg;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: " << configPath_ << "\n";
    for (const auto& kv : values_) {
        std::cout << "  " << kv.first << " = " << kv.second << "\n";
    }
}

bool ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos != std::string::npos) {
                currentSection = trim(line.substr(1, closePos - 1));
            }
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));

        // Trailing inline comment
        size_t hashPos = value.find(" #");
        if (hashPos != std::string::npos) value = trim(value.substr(0, hashPos));

        values_[currentSection + "." + key] = value;
    }

    return !values_.empty();
}

}
