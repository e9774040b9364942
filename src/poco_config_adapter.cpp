#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace
{
    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    const char *kDefaultConfig = R"(
        log_level: "INFO"
        log_file: ""
        tools:
          ffmpeg: "ffmpeg"
          ffprobe: "ffprobe"
          recover_mp4: "recover_mp4"
        probe:
          backend: "ffprobe"
          timeout_seconds: 60
        scan:
          recursive: false
          hwaccel: "auto"
          decode_timeout_seconds: 3600
          moov_timeout_seconds: 120
          nonzero_exit_is_corrupt: true
          video_extensions: [mp4, m4v, mov, mkv, avi, wmv, asf, flv, f4v, webm, mpg, mpeg, vob, ts, mts, m2ts, 3gp, 3g2, ogv, divx, rm, rmvb]
          moov_extensions: [mp4, m4v, mov, m4a, 3gp, 3g2]
        repair:
          output_dir: "repaired"
          timeout_seconds: 7200
          video_encoder: "auto"
    )";
}

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
    initializeDefaultConfig();
}

void PocoConfigAdapter::initializeDefaultConfig()
{
    if (!poco_cfg_.loadYamlString(kDefaultConfig))
    {
        Logger::error("Built-in default configuration could not be parsed");
    }
}

void PocoConfigAdapter::resetToDefaults()
{
    poco_cfg_.clear();
    initializeDefaultConfig();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

std::string PocoConfigAdapter::getLogFile() const
{
    return poco_cfg_.getString("log_file", "");
}

ToolPaths PocoConfigAdapter::getToolPaths() const
{
    ToolPaths tools;
    tools.ffmpeg = poco_cfg_.getString("tools.ffmpeg", tools.ffmpeg);
    tools.ffprobe = poco_cfg_.getString("tools.ffprobe", tools.ffprobe);
    tools.recover_mp4 = poco_cfg_.getString("tools.recover_mp4", tools.recover_mp4);
    return tools;
}

ProbeBackend PocoConfigAdapter::getProbeBackend() const
{
    std::string backend = poco_cfg_.getString("probe.backend", "ffprobe");
    backend = toLower(backend);
    if (backend == "libavformat" || backend == "libav")
        return ProbeBackend::Libavformat;
    if (backend != "ffprobe")
    {
        Logger::warn("Unknown probe backend '" + backend + "', using ffprobe");
    }
    return ProbeBackend::FFprobe;
}

int PocoConfigAdapter::getProbeTimeoutSeconds() const
{
    return poco_cfg_.getInt("probe.timeout_seconds", 60);
}

std::string PocoConfigAdapter::getHwaccel() const
{
    return poco_cfg_.getString("scan.hwaccel", "auto");
}

int PocoConfigAdapter::getDecodeTimeoutSeconds() const
{
    return poco_cfg_.getInt("scan.decode_timeout_seconds", 3600);
}

int PocoConfigAdapter::getMoovTimeoutSeconds() const
{
    return poco_cfg_.getInt("scan.moov_timeout_seconds", 120);
}

bool PocoConfigAdapter::getNonzeroExitIsCorrupt() const
{
    return poco_cfg_.getBool("scan.nonzero_exit_is_corrupt", true);
}

bool PocoConfigAdapter::getRecursive() const
{
    return poco_cfg_.getBool("scan.recursive", false);
}

std::vector<std::string> PocoConfigAdapter::getVideoExtensions() const
{
    return splitList(poco_cfg_.getString("scan.video_extensions", ""));
}

std::vector<std::string> PocoConfigAdapter::getMoovExtensions() const
{
    return splitList(poco_cfg_.getString("scan.moov_extensions", ""));
}

std::string PocoConfigAdapter::getRepairOutputDir() const
{
    return poco_cfg_.getString("repair.output_dir", "repaired");
}

int PocoConfigAdapter::getRepairTimeoutSeconds() const
{
    return poco_cfg_.getInt("repair.timeout_seconds", 7200);
}

std::string PocoConfigAdapter::getVideoEncoder() const
{
    return poco_cfg_.getString("repair.video_encoder", "auto");
}

ScanSettings PocoConfigAdapter::getScanSettings() const
{
    ScanSettings settings;
    settings.tools = getToolPaths();
    settings.probe_backend = getProbeBackend();
    settings.probe_timeout_seconds = getProbeTimeoutSeconds();
    settings.hwaccel = getHwaccel();
    settings.decode_timeout_seconds = getDecodeTimeoutSeconds();
    settings.moov_timeout_seconds = getMoovTimeoutSeconds();
    settings.nonzero_exit_is_corrupt = getNonzeroExitIsCorrupt();
    settings.recursive = getRecursive();

    auto video_extensions = getVideoExtensions();
    if (!video_extensions.empty())
        settings.video_extensions = video_extensions;
    auto moov_extensions = getMoovExtensions();
    if (!moov_extensions.empty())
        settings.moov_extensions = moov_extensions;
    return settings;
}

RepairSettings PocoConfigAdapter::getRepairSettings(const std::string &resolved_encoder) const
{
    RepairSettings settings;
    settings.tools = getToolPaths();
    settings.probe_backend = getProbeBackend();
    settings.probe_timeout_seconds = getProbeTimeoutSeconds();
    settings.output_dir = getRepairOutputDir();
    settings.timeout_seconds = getRepairTimeoutSeconds();
    settings.video_encoder = resolved_encoder;
    return settings;
}

void PocoConfigAdapter::updateConfig(const nlohmann::json &patch)
{
    poco_cfg_.update(patch);
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    std::string ext = std::filesystem::path(file_path).extension().string();
    ext = toLower(ext);

    try
    {
        bool loaded = (ext == ".yaml" || ext == ".yml") ? poco_cfg_.loadYaml(file_path)
                                                        : poco_cfg_.load(file_path);
        if (loaded)
        {
            Logger::info("Configuration loaded from " + file_path);
        }
        else
        {
            Logger::warn("Configuration file not readable: " + file_path);
        }
        return loaded;
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to parse configuration file " + file_path + ": " + e.what());
        return false;
    }
}

std::vector<std::string> PocoConfigAdapter::splitList(const std::string &value)
{
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item.erase(0, item.find_first_not_of(" \t\"["));
        auto last = item.find_last_not_of(" \t\"]");
        if (last == std::string::npos)
            continue;
        item.erase(last + 1);
        item = toLower(item);
        if (item.rfind('.', 0) == 0)
            item.erase(0, 1);
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}
