// config_manager.cpp - YAML configuration implementation
#include "safepy/config_manager.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

namespace safepy {

namespace {

void ApplyYaml(const YAML::Node& yaml, SafepyConfig& config) {
    // Sandbox settings
    if (yaml["sandbox"]) {
        auto sandbox = yaml["sandbox"];
        if (sandbox["timeout_seconds"]) {
            double seconds = sandbox["timeout_seconds"].as<double>();
            if (!TimeoutFromSeconds(seconds, config.sandbox.timeout)) {
                spdlog::warn("Invalid sandbox timeout_seconds {}, using default", seconds);
            }
        }
        if (sandbox["interrupt_on_timeout"]) config.sandbox.interrupt_on_timeout = sandbox["interrupt_on_timeout"].as<bool>();
        if (sandbox["interrupt_grace_ms"]) {
            long long grace_ms = sandbox["interrupt_grace_ms"].as<long long>();
            grace_ms = std::clamp<long long>(grace_ms, 0,
                std::chrono::duration_cast<std::chrono::milliseconds>(kMaxTimeout).count());
            config.sandbox.interrupt_grace = std::chrono::milliseconds(grace_ms);
        }
    }

    // Policy settings (lists replace the defaults entirely)
    if (yaml["policy"]) {
        auto policy = yaml["policy"];
        if (policy["allowed_functions"]) {
            config.sandbox.policy.allowed_functions.clear();
            for (const auto& name : policy["allowed_functions"]) {
                config.sandbox.policy.allowed_functions.insert(name.as<std::string>());
            }
        }
        if (policy["allowed_methods"]) {
            config.sandbox.policy.allowed_methods.clear();
            for (const auto& fragment : policy["allowed_methods"]) {
                config.sandbox.policy.allowed_methods.insert(fragment.as<std::string>());
            }
        }
    }

    // Logging settings
    if (yaml["logging"]) {
        auto logging = yaml["logging"];
        if (logging["level"]) config.log_level = logging["level"].as<std::string>();
        if (logging["file"]) config.log_file = logging["file"].as<std::string>();
    }
}

} // anonymous namespace

bool TimeoutFromSeconds(double seconds, std::chrono::milliseconds& timeout) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return false;
    }

    const double max_seconds = static_cast<double>(kMaxTimeout.count());
    if (seconds > max_seconds) {
        seconds = max_seconds;
    }
    // Sub-millisecond budgets round up to 1 ms
    long long ms = std::max<long long>(static_cast<long long>(std::ceil(seconds * 1000.0)), 1);
    timeout = std::chrono::milliseconds(ms);
    return true;
}

ConfigManager::ConfigManager() {
    cached_config_ = GetDefaultConfig();
    spdlog::debug("ConfigManager created");
}

bool ConfigManager::Load(const std::string& path) {
    return LoadConfig(path, cached_config_);
}

bool ConfigManager::Save() {
    if (last_loaded_path_.empty()) {
        last_loaded_path_ = FindConfigFile();
    }
    return SaveConfig(cached_config_, last_loaded_path_);
}

bool ConfigManager::LoadConfig(const std::string& path, SafepyConfig& config) {
    try {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file not found: {}, using defaults", path);
            config = GetDefaultConfig();
            return true;
        }

        YAML::Node yaml = YAML::LoadFile(path);
        last_loaded_path_ = path;

        SafepyConfig loaded = GetDefaultConfig();
        ApplyYaml(yaml, loaded);
        config = loaded;

        spdlog::info("Config loaded from: {}", path);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        config = GetDefaultConfig();
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

bool ConfigManager::LoadFromString(const std::string& yaml_text, SafepyConfig& config) {
    try {
        SafepyConfig loaded = GetDefaultConfig();
        ApplyYaml(YAML::Load(yaml_text), loaded);
        config = loaded;
        return true;
    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

bool ConfigManager::SaveConfig(const SafepyConfig& config, const std::string& path) {
    try {
        // Create parent directories if needed
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Sandbox settings
        out << YAML::Key << "sandbox" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "timeout_seconds" << YAML::Value << config.sandbox.timeout.count() / 1000.0;
        out << YAML::Key << "interrupt_on_timeout" << YAML::Value << config.sandbox.interrupt_on_timeout;
        out << YAML::Key << "interrupt_grace_ms" << YAML::Value << static_cast<long long>(config.sandbox.interrupt_grace.count());
        out << YAML::EndMap;

        // Policy settings, sorted so saved files diff cleanly
        std::vector<std::string> functions(config.sandbox.policy.allowed_functions.begin(),
                                           config.sandbox.policy.allowed_functions.end());
        std::vector<std::string> methods(config.sandbox.policy.allowed_methods.begin(),
                                         config.sandbox.policy.allowed_methods.end());
        std::sort(functions.begin(), functions.end());
        std::sort(methods.begin(), methods.end());

        out << YAML::Key << "policy" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "allowed_functions" << YAML::Value << YAML::Flow << functions;
        out << YAML::Key << "allowed_methods" << YAML::Value << YAML::Flow << methods;
        out << YAML::EndMap;

        // Logging settings
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.log_level;
        out << YAML::Key << "file" << YAML::Value << config.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open config file for writing: {}", path);
            return false;
        }
        file << out.c_str();
        file.close();

        spdlog::info("Config saved to: {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

SafepyConfig ConfigManager::GetDefaultConfig() {
    return SafepyConfig();
}

std::string ConfigManager::FindConfigFile() {
    // Check in order of priority
    std::vector<std::string> paths = {
        "./config/safepy.yaml",
        "./safepy.yaml",
        std::string(getenv("HOME") ? getenv("HOME") : "") + "/.config/safepy/safepy.yaml",
    };

    for (const auto& path : paths) {
        if (!path.empty() && std::filesystem::exists(path)) {
            return path;
        }
    }

    return "./config/safepy.yaml";  // Default location
}

} // namespace safepy
