#pragma once

#include "core/cancellation_token.hpp"
#include "core/scan_settings.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One video or audio stream from a detail probe
 */
struct StreamInfo
{
    int index = 0;
    std::string codec_type; // "video" or "audio"
    std::string codec_name;
    double frame_rate = 0.0;  // video only, 0 when unknown
    int64_t bit_rate = 0;     // bits per second, 0 when unknown
};

/**
 * @brief Container level facts about one file
 */
struct MediaProbeResult
{
    std::vector<std::string> container_format_names; // "mov,mp4,m4a" split, order kept
    std::optional<double> duration_seconds;
    uint64_t size_bytes = 0;
    std::vector<StreamInfo> streams; // filled in detail mode only

    const StreamInfo *firstStream(const std::string &codec_type) const;
    std::string joinedFormatNames() const;
};

/**
 * @brief Probe outcome; success false means ProbeFailed ("format undetermined")
 */
struct ProbeResult
{
    bool success = false;
    std::string error_message;
    MediaProbeResult media;

    ProbeResult() = default;
    ProbeResult(bool s, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Probe Adapter: container and stream metadata for a file.
 *
 * The ffprobe backend spawns
 * `ffprobe -v quiet -print_format json -show_entries format[,streams] -i <path>`
 * and parses the JSON; the libavformat backend opens the file in-process.
 */
class MediaProbe
{
public:
    MediaProbe(ProbeBackend backend, std::string ffprobe_path, int timeout_seconds);

    void setCancellationToken(const CancellationToken &token) { token_ = token; }

    /**
     * @brief Probe a file
     * @param file_path File to inspect, any extension
     * @param detail Also collect video/audio stream metadata
     */
    ProbeResult probe(const std::string &file_path, bool detail = false) const;

    /**
     * @brief Parse ffprobe JSON output
     * @param json_text stdout of ffprobe -print_format json
     * @param detail Collect video/audio streams
     */
    static ProbeResult parseProbeJson(const std::string &json_text, bool detail);

    // "30000/1001" -> 29.97; 0 on malformed or zero denominators
    static double parseFrameRate(const std::string &rate);

    static std::vector<std::string> splitFormatNames(const std::string &format_name);

private:
    ProbeResult probeWithFFprobe(const std::string &file_path, bool detail) const;
    ProbeResult probeWithLibavformat(const std::string &file_path, bool detail) const;

    ProbeBackend backend_;
    std::string ffprobe_path_;
    int timeout_seconds_;
    CancellationToken token_;
};
