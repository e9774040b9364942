#include "core/repair_executor.hpp"
#include "core/container_matcher.hpp"
#include "core/media_probe.hpp"
#include "core/moov_detector.hpp"
#include "core/tool_locator.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/TemporaryFile.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    // Removes the intermediate directory of a repair, whatever happens
    class WorkDirectory
    {
    public:
        WorkDirectory() : path_(Poco::TemporaryFile::tempName())
        {
            fs::create_directories(path_);
        }

        ~WorkDirectory()
        {
            std::error_code ec;
            fs::remove_all(path_, ec);
            if (ec)
            {
                Logger::warn("Could not remove work directory " + path_ + ": " + ec.message());
            }
        }

        WorkDirectory(const WorkDirectory &) = delete;
        WorkDirectory &operator=(const WorkDirectory &) = delete;

        const std::string &path() const { return path_; }

    private:
        std::string path_;
    };

    // A failed plan must not leave half-written files next to real repairs
    void removePartialOutputs(const RepairPlan &plan)
    {
        for (const auto &output : plan.outputs)
        {
            std::error_code ec;
            if (fs::remove(output, ec))
            {
                Logger::debug("Removed partial output " + output);
            }
            else if (ec)
            {
                Logger::warn("Could not remove partial output " + output + ": " + ec.message());
            }
        }
    }
}

std::string RepairOutcome::getStatusName(Status status)
{
    switch (status)
    {
    case Status::Repaired:
        return "repaired";
    case Status::Skipped:
        return "skipped";
    case Status::Failed:
        return "failed";
    default:
        return "unknown";
    }
}

RepairExecutor::RepairExecutor(RepairSettings settings)
    : settings_(settings), planner_(std::move(settings))
{
}

bool RepairExecutor::ensureOutputDirectory(RepairOutcome &outcome) const
{
    std::error_code ec;
    fs::create_directories(settings_.output_dir, ec);
    if (ec)
    {
        outcome.status = RepairOutcome::Status::Failed;
        outcome.reason = "cannot create output directory " + settings_.output_dir + ": " + ec.message();
        return false;
    }
    return true;
}

RepairOutcome RepairExecutor::repair(const ScanRecord &record, ScanKind scan_kind) const
{
    RepairOutcome outcome;
    outcome.file_path = record.file_path;

    if (!record.classification.is_corrupt)
    {
        outcome.reason = "not corrupt";
        return outcome;
    }
    if (token_.isCancelled())
    {
        outcome.reason = "cancelled";
        return outcome;
    }

    try
    {
        switch (scan_kind)
        {
        case ScanKind::GeneralCorruption:
            return repairGeneral(record);
        case ScanKind::ContainerExtensionMismatch:
            return fixExtension(record);
        case ScanKind::MoovPosition:
            return fixMoov(record);
        case ScanKind::Retrieve:
        default:
            outcome.reason = "nothing to repair";
            return outcome;
        }
    }
    catch (const Poco::Exception &e)
    {
        outcome.status = RepairOutcome::Status::Failed;
        outcome.reason = e.displayText();
    }
    catch (const std::exception &e)
    {
        outcome.status = RepairOutcome::Status::Failed;
        outcome.reason = e.what();
    }
    Logger::error("Repair of " + record.file_path + " failed: " + outcome.reason);
    return outcome;
}

RepairReport RepairExecutor::repairAll(const ScanReport &report) const
{
    RepairReport result;
    Logger::info("Repairing " + std::to_string(report.corruptCount()) + " corrupt file(s) into " +
                 settings_.output_dir);

    for (const auto &record : report.records)
    {
        if (!record.classification.is_corrupt)
            continue;
        if (token_.isCancelled())
        {
            result.cancelled = true;
            RepairOutcome outcome;
            outcome.file_path = record.file_path;
            outcome.reason = "cancelled";
            result.outcomes.push_back(outcome);
            continue;
        }
        result.outcomes.push_back(repair(record, report.scan_kind));
    }

    result.cancelled = result.cancelled || token_.isCancelled();
    Logger::info("Repair finished: " + std::to_string(result.count(RepairOutcome::Status::Repaired)) +
                 " repaired, " + std::to_string(result.count(RepairOutcome::Status::Skipped)) + " skipped, " +
                 std::to_string(result.count(RepairOutcome::Status::Failed)) + " failed");
    return result;
}

bool RepairExecutor::runPlan(const RepairPlan &plan, RepairOutcome &outcome) const
{
    for (const auto &step : plan.steps)
    {
        if (token_.isCancelled())
        {
            outcome.status = RepairOutcome::Status::Skipped;
            outcome.reason = "cancelled";
            removePartialOutputs(plan);
            return false;
        }

        Logger::info("Repair step (" + step.description + ") for " + outcome.file_path);
        Logger::debug("Running: " + step.invocation.toString());

        ExternalProcess process(step.invocation, ExternalProcess::Capture::StdErr);
        process.setTimeout(std::chrono::seconds(settings_.timeout_seconds));
        process.setCancellationToken(token_);

        std::vector<std::string> diagnostics;
        ProcessResult result = process.runCollect(diagnostics);
        if (!result.success)
        {
            outcome.status = result.cancelled ? RepairOutcome::Status::Skipped : RepairOutcome::Status::Failed;
            outcome.reason = step.description + ": " + result.error_message;
            if (!diagnostics.empty())
            {
                Logger::debug("Last tool output: " + diagnostics.back());
            }
            removePartialOutputs(plan);
            return false;
        }
    }

    for (const auto &output : plan.outputs)
    {
        std::error_code ec;
        if (!fs::exists(output, ec) || fs::file_size(output, ec) == 0)
        {
            outcome.status = RepairOutcome::Status::Failed;
            outcome.reason = "expected output was not produced: " + output;
            removePartialOutputs(plan);
            return false;
        }
    }
    return true;
}

RepairOutcome RepairExecutor::repairGeneral(const ScanRecord &record) const
{
    RepairOutcome outcome;
    outcome.file_path = record.file_path;

    RepairContext context{record.extension, record.classification.matched_signatures};
    outcome.error_class = ErrorClassifier::selectRule(context);
    if (outcome.error_class == ErrorClass::NoKnownRepair)
    {
        outcome.reason = "no known repair";
        Logger::warn("No known repair for " + record.file_path);
        return outcome;
    }
    Logger::info("Repair rule for " + record.file_path + ": " + ErrorClassifier::getClassName(outcome.error_class));

    // Missing metadata falls back to encoder defaults
    MediaProbe probe(settings_.probe_backend, settings_.tools.ffprobe, settings_.probe_timeout_seconds);
    probe.setCancellationToken(token_);
    ProbeResult probed = probe.probe(record.file_path, true);
    MediaProbeResult media;
    if (probed.success)
    {
        media = probed.media;
    }
    else
    {
        Logger::warn("Stream metadata unavailable for " + record.file_path + " (" + probed.error_message +
                     "), repairing with defaults");
        media.size_bytes = record.size_bytes;
        if (record.duration_seconds > 0.0)
            media.duration_seconds = record.duration_seconds;
    }

    if (!ensureOutputDirectory(outcome))
        return outcome;

    WorkDirectory work_dir;
    RepairPlan plan = planner_.plan(outcome.error_class, record.file_path, media, work_dir.path());

    if (plan.needs_recover_mp4 && ToolLocator::resolve(settings_.tools.recover_mp4).empty())
    {
        outcome.status = RepairOutcome::Status::Failed;
        outcome.reason = "recover_mp4 not found: " + settings_.tools.recover_mp4;
        return outcome;
    }

    if (!runPlan(plan, outcome))
    {
        Logger::warn("Repair of " + record.file_path + " did not complete: " + outcome.reason);
        return outcome;
    }

    outcome.status = RepairOutcome::Status::Repaired;
    outcome.outputs = plan.outputs;
    outcome.reason = ErrorClassifier::getClassName(outcome.error_class);
    Logger::info("Repaired " + record.file_path + " (" + std::to_string(plan.outputs.size()) + " output file(s))");
    return outcome;
}

RepairOutcome RepairExecutor::fixExtension(const ScanRecord &record) const
{
    RepairOutcome outcome;
    outcome.file_path = record.file_path;

    MediaProbe probe(settings_.probe_backend, settings_.tools.ffprobe, settings_.probe_timeout_seconds);
    probe.setCancellationToken(token_);
    ProbeResult probed = probe.probe(record.file_path, false);

    std::vector<std::string> candidates;
    if (probed.success)
    {
        candidates = probed.media.container_format_names;
    }
    else
    {
        Logger::warn("Re-probe of " + record.file_path + " failed: " + probed.error_message);
    }

    const std::string extension = ContainerMatcher::chooseExtension(candidates);
    fs::path source(record.file_path);
    std::string target_name = extension == "unknown"
                                  ? source.filename().string() + ".unknown"
                                  : source.stem().string() + "." + extension;

    if (!ensureOutputDirectory(outcome))
        return outcome;

    fs::path target = fs::path(settings_.output_dir) / target_name;
    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        outcome.status = RepairOutcome::Status::Failed;
        outcome.reason = "copy to " + target.string() + " failed: " + ec.message();
        return outcome;
    }

    outcome.status = RepairOutcome::Status::Repaired;
    outcome.outputs.push_back(target.string());
    outcome.reason = "extension changed to ." + extension;
    Logger::info("Extension fix: " + record.file_path + " -> " + target.string());
    return outcome;
}

RepairOutcome RepairExecutor::fixMoov(const ScanRecord &record) const
{
    RepairOutcome outcome;
    outcome.file_path = record.file_path;

    if (record.moov_state != MoovScanState::FoundMdat)
    {
        // A missing moov box cannot be moved
        outcome.reason = MoovDetector::describe(record.moov_state) + ", no known repair";
        return outcome;
    }

    if (!ensureOutputDirectory(outcome))
        return outcome;

    RepairPlan plan = planner_.planFaststart(record.file_path);
    if (!runPlan(plan, outcome))
    {
        Logger::warn("Faststart remux of " + record.file_path + " failed: " + outcome.reason);
        return outcome;
    }

    outcome.status = RepairOutcome::Status::Repaired;
    outcome.outputs = plan.outputs;
    outcome.reason = "moov moved to front";
    return outcome;
}
