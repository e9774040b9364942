#pragma once

#include "core/error_classifier.hpp"
#include "core/external_process.hpp"
#include "core/media_probe.hpp"
#include "core/scan_settings.hpp"
#include <string>
#include <vector>

/**
 * @brief One external tool call of a repair
 */
struct RepairStep
{
    std::string description;
    ToolInvocation invocation;
};

/**
 * @brief The tool calls that implement one remediation, run in order
 */
struct RepairPlan
{
    ErrorClass error_class = ErrorClass::NoKnownRepair;
    std::vector<RepairStep> steps;
    std::vector<std::string> outputs;       // final files, in the output directory
    std::vector<std::string> intermediates; // removed once the plan finished
    bool needs_recover_mp4 = false;

    bool empty() const { return steps.empty(); }
};

/**
 * @brief Turns a repair rule into concrete encoder invocations.
 *
 * Metadata that could not be probed is passed as zero; the matching
 * flag (-r, -b:v, -b:a) is then left out and the encoder default used.
 */
class RepairPlanner
{
public:
    explicit RepairPlanner(RepairSettings settings);

    /**
     * @brief Build the plan for a classified file
     * @param error_class Rule selected by ErrorClassifier::selectRule
     * @param input_path Original file, never written to
     * @param media Detail probe of the file, possibly empty
     * @param work_dir Directory for intermediate files
     */
    RepairPlan plan(ErrorClass error_class, const std::string &input_path,
                    const MediaProbeResult &media, const std::string &work_dir) const;

    // Stream copy with the moov atom moved to the front
    RepairPlan planFaststart(const std::string &input_path) const;

    /**
     * @brief Output file name in the output directory
     * @param suffix e.g. "Repaired", appended to the stem after a dash
     * @param extension Without the dot; empty keeps the input extension
     */
    std::string outputPath(const std::string &input_path, const std::string &suffix,
                           const std::string &extension = "") const;

    // Video bitrate that keeps the file size: size * 8 / duration, 0 if unknown
    static int64_t bitrateFromSize(uint64_t size_bytes, const std::optional<double> &duration_seconds);

    static std::string formatFrameRate(double frame_rate);

    const RepairSettings &settings() const { return settings_; }

private:
    ToolInvocation ffmpeg(std::vector<std::string> args) const;

    void planNalRecovery(RepairPlan &plan, const std::string &input_path,
                         const MediaProbeResult &media, const std::string &work_dir) const;

    RepairSettings settings_;
};
