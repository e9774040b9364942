#include "core/hardware_encoder.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

extern "C"
{
#include <libavcodec/avcodec.h>
}

namespace fs = std::filesystem;

namespace
{
    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }
}

std::string HardwareEncoder::describeVendorId(const std::string &vendor_id)
{
    const std::string id = toLower(vendor_id);
    if (id == "0x10de")
        return "NVIDIA Corporation";
    if (id == "0x1002" || id == "0x1022")
        return "Advanced Micro Devices, Inc. [AMD/ATI]";
    if (id == "0x8086")
        return "Intel Corporation";
    return "Unknown vendor " + vendor_id;
}

std::vector<std::string> HardwareEncoder::queryDisplayAdapters(const std::string &drm_root)
{
    std::vector<std::string> adapters;
    try
    {
        if (!fs::exists(drm_root) || !fs::is_directory(drm_root))
        {
            Logger::debug("No DRM devices under " + drm_root);
            return adapters;
        }

        std::vector<fs::path> cards;
        for (const auto &entry : fs::directory_iterator(drm_root))
        {
            const std::string name = entry.path().filename().string();
            // card0, card1 ... but not the connector entries like card0-HDMI-A-1
            if (name.rfind("card", 0) == 0 && name.find('-') == std::string::npos)
            {
                cards.push_back(entry.path());
            }
        }
        std::sort(cards.begin(), cards.end());

        for (const auto &card : cards)
        {
            std::ifstream vendor_file(card / "device" / "vendor");
            std::string vendor_id;
            if (vendor_file && std::getline(vendor_file, vendor_id))
            {
                vendor_id.erase(vendor_id.find_last_not_of(" \t\r\n") + 1);
                adapters.push_back(describeVendorId(vendor_id));
            }
        }
    }
    catch (const fs::filesystem_error &e)
    {
        Logger::warn("Could not enumerate display adapters: " + std::string(e.what()));
    }
    return adapters;
}

VideoEncoderBackend HardwareEncoder::selectBackend(const std::vector<std::string> &adapter_descriptions)
{
    bool has_amd = false;
    for (const auto &description : adapter_descriptions)
    {
        const std::string lower = toLower(description);
        if (lower.find("nvidia") != std::string::npos)
            return VideoEncoderBackend::Nvidia;
        if (lower.find("amd") != std::string::npos || lower.find("radeon") != std::string::npos)
            has_amd = true;
    }
    return has_amd ? VideoEncoderBackend::Amd : VideoEncoderBackend::Software;
}

std::string HardwareEncoder::encoderName(VideoEncoderBackend backend)
{
    switch (backend)
    {
    case VideoEncoderBackend::Nvidia:
        return "h264_nvenc";
    case VideoEncoderBackend::Amd:
        return "h264_amf";
    case VideoEncoderBackend::Software:
    default:
        return "libx264";
    }
}

bool HardwareEncoder::isKnownToLibavcodec(const std::string &encoder_name)
{
    return avcodec_find_encoder_by_name(encoder_name.c_str()) != nullptr;
}

std::string HardwareEncoder::resolve(const std::string &configured)
{
    std::string encoder;
    if (configured.empty() || toLower(configured) == "auto")
    {
        auto adapters = HardwareEncoder::queryDisplayAdapters();
        for (const auto &adapter : adapters)
        {
            Logger::debug("Display adapter: " + adapter);
        }
        encoder = encoderName(selectBackend(adapters));
        Logger::info("Selected video encoder: " + encoder);
    }
    else
    {
        encoder = configured;
        Logger::info("Using configured video encoder: " + encoder);
    }

    // The ffmpeg binary may be built differently from the linked library
    if (!isKnownToLibavcodec(encoder))
    {
        Logger::warn("Encoder " + encoder + " is not known to the linked libavcodec; ffmpeg may reject it");
    }
    return encoder;
}
