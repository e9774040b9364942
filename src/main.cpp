#include "core/corruption_scanner.hpp"
#include "core/file_scanner.hpp"
#include "core/hardware_encoder.hpp"
#include "core/job_runner.hpp"
#include "core/media_probe.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/repair_executor.hpp"
#include "core/report_writer.hpp"
#include "core/shutdown_manager.hpp"
#include "core/tool_locator.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitError = 1;
    constexpr int kExitMissingTool = 2;
    constexpr int kExitInterrupted = 130;

    struct CommandLine
    {
        std::string command;
        std::string kind_name;
        std::vector<std::string> paths;
        std::string csv_path;
        std::string json_path;
        std::string output_dir;
        std::string from_report;
        std::string config_path;
        std::string log_level;
        std::string encoder;
        std::optional<int> timeout_seconds;
        bool recursive = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "vidscan - video corruption scanner and repair dispatcher" << std::endl;
        std::cout << "Usage:" << std::endl;
        std::cout << "  " << program << " check" << std::endl;
        std::cout << "  " << program << " scan <general|extension|moov|retrieve> <path>... [--csv FILE] [--json FILE]" << std::endl;
        std::cout << "  " << program << " repair <general|extension|moov> <path>... [--output DIR]" << std::endl;
        std::cout << "  " << program << " repair --from-report <report.json> [--output DIR]" << std::endl;
        std::cout << "  " << program << " info <file>" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE      JSON or YAML configuration" << std::endl;
        std::cout << "  --recursive, -r    Descend into sub-folders" << std::endl;
        std::cout << "  --log-level LEVEL  TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --encoder NAME     Video encoder for re-encoding repairs (default: detect)" << std::endl;
        std::cout << "  --timeout SECONDS  Decode timeout per file" << std::endl;
        std::cout << "  --help, -h         Show this help message" << std::endl;
    }

    // Returns an error message, empty on success
    std::string parseArguments(int argc, char *argv[], CommandLine &cli)
    {
        std::vector<std::string> positional;
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto next = [&]() -> std::optional<std::string>
            {
                if (i + 1 >= argc)
                    return std::nullopt;
                return std::string(argv[++i]);
            };

            if (arg == "--recursive" || arg == "-r")
            {
                cli.recursive = true;
            }
            else if (arg == "--csv" || arg == "--json" || arg == "--output" || arg == "--from-report" ||
                     arg == "--config" || arg == "--log-level" || arg == "--encoder" || arg == "--timeout")
            {
                auto value = next();
                if (!value)
                    return "Missing value for " + arg;
                if (arg == "--csv")
                    cli.csv_path = *value;
                else if (arg == "--json")
                    cli.json_path = *value;
                else if (arg == "--output")
                    cli.output_dir = *value;
                else if (arg == "--from-report")
                    cli.from_report = *value;
                else if (arg == "--config")
                    cli.config_path = *value;
                else if (arg == "--log-level")
                    cli.log_level = *value;
                else if (arg == "--encoder")
                    cli.encoder = *value;
                else
                {
                    try
                    {
                        cli.timeout_seconds = std::stoi(*value);
                    }
                    catch (const std::exception &)
                    {
                        return "Invalid timeout: " + *value;
                    }
                    if (*cli.timeout_seconds <= 0)
                        return "Timeout must be positive: " + *value;
                }
            }
            else if (arg.size() > 1 && arg[0] == '-')
            {
                return "Unknown option: " + arg;
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (positional.empty())
            return "Missing command";
        cli.command = positional.front();
        positional.erase(positional.begin());

        if (cli.command == "scan" || (cli.command == "repair" && cli.from_report.empty()))
        {
            if (positional.empty())
                return "Missing scan kind";
            cli.kind_name = positional.front();
            positional.erase(positional.begin());
            if (positional.empty())
                return "No files or folders given";
        }
        cli.paths = positional;

        if (cli.command == "info" && cli.paths.size() != 1)
            return "info takes exactly one file";
        if (cli.command != "scan" && cli.command != "repair" && cli.command != "info" && cli.command != "check")
            return "Unknown command: " + cli.command;
        return "";
    }

    void printDependencyTable(const std::vector<ToolStatus> &statuses)
    {
        for (const auto &status : statuses)
        {
            std::cout << std::left << std::setw(12) << status.name << " "
                      << std::setw(10) << (status.found() ? "found" : "NOT FOUND") << " "
                      << (status.found() ? status.resolved_path : status.configured)
                      << (status.required ? "" : " (optional)") << std::endl;
        }
    }

    void printScanSummary(const ScanReport &report)
    {
        std::cout << std::endl
                  << ScanKinds::getKindName(report.scan_kind) << " scan: " << report.records.size() << " file(s), "
                  << report.corruptCount() << " flagged" << (report.cancelled ? " (cancelled)" : "") << std::endl;
        for (const auto &record : report.records)
        {
            std::cout << (record.classification.is_corrupt ? "[CORRUPT] " : "[ok]      ") << record.file_path
                      << " - " << record.result_text << std::endl;
        }
        if (!report.skipped.empty())
        {
            std::cout << "Skipped:" << std::endl;
            for (const auto &skipped : report.skipped)
            {
                std::cout << "  " << skipped.first << ": " << skipped.second << std::endl;
            }
        }
    }

    void printRepairSummary(const RepairReport &report)
    {
        std::cout << std::endl
                  << "Repair: " << report.count(RepairOutcome::Status::Repaired) << " repaired, "
                  << report.count(RepairOutcome::Status::Skipped) << " skipped, "
                  << report.count(RepairOutcome::Status::Failed) << " failed"
                  << (report.cancelled ? " (cancelled)" : "") << std::endl;
        for (const auto &outcome : report.outcomes)
        {
            std::cout << "  [" << RepairOutcome::getStatusName(outcome.status) << "] " << outcome.file_path
                      << ": " << outcome.reason << std::endl;
            for (const auto &output : outcome.outputs)
            {
                std::cout << "      -> " << output << std::endl;
            }
        }
    }

    int runCheck(const ScanSettings &settings)
    {
        auto statuses = ToolLocator::checkDependencies(settings.tools,
                                                       settings.probe_backend == ProbeBackend::FFprobe);
        printDependencyTable(statuses);
        return ToolLocator::allRequiredFound(statuses) ? kExitOk : kExitMissingTool;
    }

    int runInfo(const ScanSettings &settings, const std::string &file_path)
    {
        MediaProbe probe(settings.probe_backend, settings.tools.ffprobe, settings.probe_timeout_seconds);
        ProbeResult result = probe.probe(file_path, true);
        if (!result.success)
        {
            std::cout << file_path << ": format undetermined (" << result.error_message << ")" << std::endl;
            return kExitError;
        }

        const MediaProbeResult &media = result.media;
        std::cout << "File:      " << file_path << std::endl;
        std::cout << "Container: " << media.joinedFormatNames() << std::endl;
        std::cout << "Duration:  " << (media.duration_seconds ? std::to_string(*media.duration_seconds) + " s" : "unknown")
                  << std::endl;
        std::cout << "Size:      " << media.size_bytes << " bytes" << std::endl;
        for (const auto &stream : media.streams)
        {
            std::cout << "Stream #" << stream.index << ": " << stream.codec_type << " " << stream.codec_name;
            if (stream.frame_rate > 0.0)
                std::cout << ", " << stream.frame_rate << " fps";
            if (stream.bit_rate > 0)
                std::cout << ", " << stream.bit_rate << " b/s";
            std::cout << std::endl;
        }
        return kExitOk;
    }

    std::optional<ScanReport> runScanJob(JobRunner &runner, const ScanSettings &settings, ScanKind kind,
                                         const std::vector<std::string> &paths)
    {
        FileScanner scanner(settings.video_extensions);
        std::vector<std::string> files = scanner.collect(paths, settings.recursive);
        auto skipped = scanner.getSkipped();
        if (files.empty() && skipped.empty())
        {
            Logger::warn("No video files found");
        }

        auto future = runner.submit<ScanReport>(
            [settings, kind, files](const CancellationToken &token)
            {
                CorruptionScanner corruption_scanner(settings);
                corruption_scanner.setCancellationToken(token);
                return corruption_scanner.scan(files, kind, [](size_t index, size_t total, const ScanRecord &record)
                                               { Logger::debug("[" + std::to_string(index) + "/" + std::to_string(total) +
                                                               "] " + record.file_path); });
            });

        try
        {
            ScanReport report = future.get();
            report.skipped.insert(report.skipped.begin(), skipped.begin(), skipped.end());
            return report;
        }
        catch (const std::exception &e)
        {
            Logger::error("Scan job failed: " + std::string(e.what()));
            return std::nullopt;
        }
    }

    int runScan(JobRunner &runner, const ScanSettings &settings, ScanKind kind, const CommandLine &cli)
    {
        auto report = runScanJob(runner, settings, kind, cli.paths);
        if (!report)
            return kExitError;

        printScanSummary(*report);

        int exit_code = report->cancelled ? kExitInterrupted : kExitOk;
        std::string error_message;
        if (!cli.csv_path.empty() && !ReportWriter::writeCsvFile(*report, cli.csv_path, error_message))
        {
            Logger::error(error_message);
            exit_code = kExitError;
        }
        if (!cli.json_path.empty() && !ReportWriter::writeJsonFile(*report, cli.json_path, error_message))
        {
            Logger::error(error_message);
            exit_code = kExitError;
        }
        return exit_code;
    }

    int runRepair(JobRunner &runner, const ScanSettings &scan_settings, const CommandLine &cli)
    {
        ScanReport report;
        if (!cli.from_report.empty())
        {
            try
            {
                report = ReportWriter::readJsonFile(cli.from_report);
            }
            catch (const std::exception &e)
            {
                Logger::error(e.what());
                return kExitError;
            }
            Logger::info("Loaded " + std::to_string(report.records.size()) + " record(s) from " + cli.from_report);
        }
        else
        {
            auto kind = ScanKinds::fromString(cli.kind_name);
            auto scanned = runScanJob(runner, scan_settings, *kind, cli.paths);
            if (!scanned)
                return kExitError;
            report = *scanned;
            printScanSummary(report);
            if (report.cancelled)
                return kExitInterrupted;
        }

        auto &config = PocoConfigAdapter::getInstance();
        std::string encoder = HardwareEncoder::resolve(config.getVideoEncoder());
        RepairSettings repair_settings = config.getRepairSettings(encoder);
        repair_settings.tools = scan_settings.tools;

        auto future = runner.submit<RepairReport>(
            [repair_settings, report](const CancellationToken &token)
            {
                RepairExecutor executor(repair_settings);
                executor.setCancellationToken(token);
                return executor.repairAll(report);
            });

        try
        {
            RepairReport repair_report = future.get();
            printRepairSummary(repair_report);
            if (repair_report.cancelled)
                return kExitInterrupted;
            return repair_report.count(RepairOutcome::Status::Failed) == 0 ? kExitOk : kExitError;
        }
        catch (const std::exception &e)
        {
            Logger::error("Repair job failed: " + std::string(e.what()));
            return kExitError;
        }
    }
}

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitOk;
        }
    }

    CommandLine cli;
    std::string parse_error = parseArguments(argc, argv, cli);
    if (!parse_error.empty())
    {
        std::cerr << "Error: " << parse_error << std::endl;
        printUsage(argv[0]);
        return kExitError;
    }

    auto &config = PocoConfigAdapter::getInstance();
    if (!cli.config_path.empty() && !config.loadConfig(cli.config_path))
    {
        std::cerr << "Error: cannot load configuration " << cli.config_path << std::endl;
        return kExitError;
    }

    // Command line options override the configuration file
    nlohmann::json overrides = nlohmann::json::object();
    if (!cli.log_level.empty())
        overrides["log_level"] = cli.log_level;
    if (cli.recursive)
        overrides["scan"]["recursive"] = true;
    if (cli.timeout_seconds)
        overrides["scan"]["decode_timeout_seconds"] = *cli.timeout_seconds;
    if (!cli.encoder.empty())
        overrides["repair"]["video_encoder"] = cli.encoder;
    if (!cli.output_dir.empty())
        overrides["repair"]["output_dir"] = cli.output_dir;
    if (!overrides.empty())
        config.updateConfig(overrides);

    Logger::init(config.getLogLevel());
    if (!config.getLogFile().empty())
    {
        Logger::addFileSink(config.getLogFile());
    }

    ScanSettings settings = config.getScanSettings();

    if (cli.command == "check")
        return runCheck(settings);

    std::optional<ScanKind> kind;
    if (!cli.kind_name.empty())
    {
        kind = ScanKinds::fromString(cli.kind_name);
        if (!kind)
        {
            std::cerr << "Error: unknown scan kind " << cli.kind_name << std::endl;
            return kExitError;
        }
    }

    // Missing tools are reported once, up front
    auto statuses = ToolLocator::checkDependencies(settings.tools, settings.probe_backend == ProbeBackend::FFprobe);
    if (!ToolLocator::allRequiredFound(statuses))
    {
        std::cerr << "Error: required external tools are missing" << std::endl;
        printDependencyTable(statuses);
        return kExitMissingTool;
    }
    settings.tools = ToolLocator::resolveAll(settings.tools);

    if (cli.command == "info")
        return runInfo(settings, cli.paths.front());

    ShutdownManager &shutdown = ShutdownManager::getInstance();
    shutdown.installSignalHandlers();

    JobRunner runner;
    shutdown.cancelOnShutdown(runner.token());

    int exit_code = kExitOk;
    if (cli.command == "scan")
        exit_code = runScan(runner, settings, *kind, cli);
    else
        exit_code = runRepair(runner, settings, cli);

    runner.stop();
    return exit_code;
}
