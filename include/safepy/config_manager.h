// config_manager.h - YAML configuration loading/saving
#pragma once

#include "api_export.h"
#include "sandbox.h"
#include <string>

namespace safepy {

struct SafepyConfig {
    Sandbox::Config sandbox;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

// Converts a time budget in seconds. NaN, infinities and non-positive values
// are rejected and leave timeout untouched; values above kMaxTimeout are capped.
SAFEPY_API bool TimeoutFromSeconds(double seconds, std::chrono::milliseconds& timeout);

class SAFEPY_API ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load config from YAML file into internal cache
    bool Load(const std::string& path);

    // Load config from YAML file
    bool LoadConfig(const std::string& path, SafepyConfig& config);

    // Parse config from a YAML document held in memory
    bool LoadFromString(const std::string& yaml_text, SafepyConfig& config);

    // Save cached config to file
    bool Save();

    // Save config to YAML file
    bool SaveConfig(const SafepyConfig& config, const std::string& path);

    const SafepyConfig& GetConfig() const { return cached_config_; }
    void SetConfig(const SafepyConfig& config) { cached_config_ = config; }

    static SafepyConfig GetDefaultConfig();

    // Get config file path (checks multiple locations)
    static std::string FindConfigFile();

private:
    std::string last_loaded_path_;
    SafepyConfig cached_config_;
};

} // namespace safepy
