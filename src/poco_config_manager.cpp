#include "core/poco_config_manager.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    nlohmann::json convertYamlNode(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json object = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                object[it->first.as<std::string>()] = convertYamlNode(it->second);
            }
            return object;
        }
        case YAML::NodeType::Sequence:
        {
            std::string joined;
            for (const auto &item : node)
            {
                if (!joined.empty())
                    joined += ",";
                joined += item.as<std::string>();
            }
            return joined;
        }
        case YAML::NodeType::Scalar:
            return node.as<std::string>();
        default:
            return nullptr;
        }
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    tmp->load(in);

    // Merge over the current tree so that defaults survive partial files
    std::stringstream ss;
    tmp->save(ss);
    update(nlohmann::json::parse(ss.str()));
    return true;
}

bool PocoConfigManager::loadYaml(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadYamlString(buffer.str());
}

bool PocoConfigManager::loadYamlString(const std::string &yaml_text)
{
    nlohmann::json converted = yamlToJson(yaml_text);
    if (!converted.is_object())
        return false;
    update(converted);
    return true;
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (node.is_array())
        {
            std::string joined;
            for (const auto &item : node)
            {
                if (!joined.empty())
                    joined += ",";
                joined += item.is_string() ? item.get<std::string>() : item.dump();
            }
            cfg_->setString(prefix, joined);
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

void PocoConfigManager::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

nlohmann::json PocoConfigManager::yamlToJson(const std::string &yaml_text)
{
    return convertYamlNode(YAML::Load(yaml_text));
}
