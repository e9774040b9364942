#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe holder of the hierarchical configuration tree.
 *
 * Keys are dotted paths ("scan.decode_timeout_seconds"). JSON files are read
 * by Poco directly, YAML files through yaml-cpp and merged with update().
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    bool load(const std::string &path);
    bool loadYaml(const std::string &path);
    bool loadYamlString(const std::string &yaml_text);

    void update(const nlohmann::json &patch);

    // Drop everything, used before re-applying defaults
    void clear();

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Convert a YAML document into the JSON shape accepted by update()
     *
     * Scalars stay strings; Poco converts them on typed access. Sequences are
     * joined with commas so list-valued keys read the same as in JSON files.
     */
    static nlohmann::json yamlToJson(const std::string &yaml_text);

private:
    PocoConfigManager();
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
