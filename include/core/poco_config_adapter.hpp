#pragma once

#include "core/poco_config_manager.hpp"
#include "core/scan_settings.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief Typed view over PocoConfigManager.
 *
 * Owns the default configuration (a YAML document) and turns the flat key
 * space into the settings structs the scanner and repair code consume.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter() = default;

    std::string getLogLevel() const;
    std::string getLogFile() const;

    // External tools
    ToolPaths getToolPaths() const;
    ProbeBackend getProbeBackend() const;
    int getProbeTimeoutSeconds() const;

    // Scan configuration getters
    std::string getHwaccel() const;
    int getDecodeTimeoutSeconds() const;
    int getMoovTimeoutSeconds() const;
    bool getNonzeroExitIsCorrupt() const;
    bool getRecursive() const;
    std::vector<std::string> getVideoExtensions() const;
    std::vector<std::string> getMoovExtensions() const;

    // Repair configuration getters
    std::string getRepairOutputDir() const;
    int getRepairTimeoutSeconds() const;
    std::string getVideoEncoder() const; // "auto" means detect from display adapters

    ScanSettings getScanSettings() const;
    RepairSettings getRepairSettings(const std::string &resolved_encoder) const;

    // Merge dotted or nested keys over the current values
    void updateConfig(const nlohmann::json &patch);

    /**
     * @brief Load a configuration file on top of the defaults
     * @param file_path .json is read by Poco, .yaml/.yml by yaml-cpp
     * @return false if the file is missing or unreadable
     */
    bool loadConfig(const std::string &file_path);

    // Restore the built-in defaults, used by tests
    void resetToDefaults();

    static std::vector<std::string> splitList(const std::string &value);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void initializeDefaultConfig();

    PocoConfigManager &poco_cfg_;
};
