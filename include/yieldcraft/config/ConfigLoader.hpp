#pragma once
// =============================================================================
// ConfigLoader.hpp - INI File Parser for yieldcraft Configuration
// =============================================================================
// Loads engine knobs from config.ini. Keys that are absent or malformed keep
// their EngineConfig defaults.
// =============================================================================

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "yieldcraft/config/EngineConfig.hpp"

namespace yieldcraft {

class ConfigLoader {
public:
    // Tries path, then ../path, then $HOME/.yieldcraft/path. Returns false if none open.
    bool load(const std::string& path = "config.ini");
    bool loadFromStream(std::istream& in);

    std::string get(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int getInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double getDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;

    // Overlay loaded values on top of cfg.
    void applyTo(EngineConfig& cfg) const;
    EngineConfig toConfig() const;

    const std::string& getConfigPath() const { return configPath_; }
    void dump() const;

private:
    bool parse(std::istream& in);

    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

}
