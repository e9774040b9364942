#pragma once

#include <string>
#include <vector>

/**
 * @brief Video encoder backends used by the re-encoding repairs
 */
enum class VideoEncoderBackend
{
    Nvidia,  // h264_nvenc
    Amd,     // h264_amf
    Software // libx264
};

/**
 * @brief Picks the encoder from the installed display adapters
 */
class HardwareEncoder
{
public:
    /**
     * @brief Describe the display adapters of this machine
     *
     * Reads the PCI vendor id of every /sys/class/drm/card* device and maps it
     * to a vendor description ("NVIDIA Corporation", ...).
     * @param drm_root Override of /sys/class/drm, used by tests
     */
    static std::vector<std::string> queryDisplayAdapters(const std::string &drm_root = "/sys/class/drm");

    // NVIDIA wins over AMD; anything else is software
    static VideoEncoderBackend selectBackend(const std::vector<std::string> &adapter_descriptions);

    static std::string encoderName(VideoEncoderBackend backend);

    static std::string describeVendorId(const std::string &vendor_id);

    /**
     * @brief Resolve the encoder to use
     * @param configured "auto" to detect, anything else is taken as an encoder name
     */
    static std::string resolve(const std::string &configured);

    // Whether the linked libavcodec knows the encoder
    static bool isKnownToLibavcodec(const std::string &encoder_name);
};
