#pragma once

#include <string>
#include <vector>

/**
 * @brief Locations of the external media tools
 *
 * Bare names are looked up on PATH by ToolLocator.
 */
struct ToolPaths
{
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    std::string recover_mp4 = "recover_mp4";
};

enum class ProbeBackend
{
    FFprobe,    // spawn ffprobe and parse its JSON
    Libavformat // probe in-process with the linked libavformat
};

struct ScanSettings
{
    ToolPaths tools;
    ProbeBackend probe_backend = ProbeBackend::FFprobe;
    int probe_timeout_seconds = 60;

    std::string hwaccel = "auto";
    int decode_timeout_seconds = 3600;
    int moov_timeout_seconds = 120;
    bool nonzero_exit_is_corrupt = true;
    bool recursive = false;

    std::vector<std::string> video_extensions = {
        "mp4", "m4v", "mov", "mkv", "avi", "wmv", "asf", "flv", "f4v", "webm",
        "mpg", "mpeg", "vob", "ts", "mts", "m2ts", "3gp", "3g2", "ogv", "divx", "rm", "rmvb"};
    std::vector<std::string> moov_extensions = {"mp4", "m4v", "mov", "m4a", "3gp", "3g2"};
};

struct RepairSettings
{
    ToolPaths tools;
    ProbeBackend probe_backend = ProbeBackend::FFprobe;
    int probe_timeout_seconds = 60;

    std::string output_dir = "repaired";
    int timeout_seconds = 7200;
    std::string video_encoder = "libx264";
};
