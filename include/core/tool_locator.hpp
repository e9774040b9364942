#pragma once

#include "core/scan_settings.hpp"
#include <string>
#include <vector>

/**
 * @brief Status of one external tool in the dependency check
 */
struct ToolStatus
{
    std::string name;          // "ffmpeg", "ffprobe", "recover_mp4"
    std::string configured;    // as configured
    std::string resolved_path; // empty if not found
    bool required = true;

    bool found() const { return !resolved_path.empty(); }
};

/**
 * @brief Resolves tool names against PATH and runs the startup dependency check
 */
class ToolLocator
{
public:
    /**
     * @brief Resolve a tool to an executable path
     * @param tool Absolute/relative path or bare name searched on PATH
     * @return Resolved path, or empty string if not found or not executable
     */
    static std::string resolve(const std::string &tool);

    /**
     * @brief Check every external tool the configuration refers to
     * @param tools Configured tool locations
     * @param need_ffprobe false when probing in-process with libavformat
     * @return One status per tool; recover_mp4 is optional
     */
    static std::vector<ToolStatus> checkDependencies(const ToolPaths &tools, bool need_ffprobe);

    // True when every required tool was found
    static bool allRequiredFound(const std::vector<ToolStatus> &statuses);

    /**
     * @brief Replace bare tool names with their resolved paths
     * @return Copy of tools with found entries resolved, others untouched
     */
    static ToolPaths resolveAll(const ToolPaths &tools);
};
