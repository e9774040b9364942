#include "core/corruption_scanner.hpp"
#include "core/container_matcher.hpp"
#include "core/error_classifier.hpp"
#include "core/file_utils.hpp"
#include "core/moov_detector.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    std::string joinSignatures(const std::vector<std::string> &signatures)
    {
        std::string joined;
        for (const auto &signature : signatures)
        {
            if (!joined.empty())
                joined += "; ";
            joined += signature;
        }
        return joined;
    }

    std::string joinFormatNames(const std::vector<std::string> &names)
    {
        std::string joined;
        for (const auto &name : names)
        {
            if (!joined.empty())
                joined += ",";
            joined += name;
        }
        return joined;
    }

    std::string formatDuration(double seconds)
    {
        std::ostringstream stream;
        stream.setf(std::ios::fixed);
        stream.precision(2);
        stream << seconds << "s";
        return stream.str();
    }
}

CorruptionScanner::CorruptionScanner(ScanSettings settings)
    : settings_(std::move(settings)),
      probe_(settings_.probe_backend, settings_.tools.ffprobe, settings_.probe_timeout_seconds),
      collector_(settings_.tools.ffmpeg, settings_.hwaccel)
{
}

void CorruptionScanner::setCancellationToken(const CancellationToken &token)
{
    token_ = token;
    probe_.setCancellationToken(token);
    collector_.setCancellationToken(token);
}

ScanRecord CorruptionScanner::makeRecord(const std::string &file_path)
{
    ScanRecord record;
    fs::path path(file_path);
    record.file_path = file_path;
    record.file_name = path.filename().string();
    record.folder = path.parent_path().string();
    record.extension = FileUtils::getFileExtension(file_path);
    record.size_bytes = FileUtils::getFileSize(file_path);
    return record;
}

ClassificationResult CorruptionScanner::classifyDecode(const std::vector<std::string> &signatures,
                                                       const ProcessResult &process, bool nonzero_exit_is_corrupt)
{
    ClassificationResult result = ErrorClassifier::classify(signatures);
    if (result.is_corrupt || !nonzero_exit_is_corrupt || process.cancelled)
        return result;

    if (process.timed_out)
    {
        result.matched_signatures.push_back("decode timed out");
        result.is_corrupt = true;
    }
    else if (process.exit_code != 0)
    {
        result.matched_signatures.push_back("decoder exited with status " + std::to_string(process.exit_code));
        result.is_corrupt = true;
    }
    return result;
}

bool CorruptionScanner::probeInto(ScanRecord &record) const
{
    ProbeResult probed = probe_.probe(record.file_path, false);
    if (!probed.success)
    {
        record.probe_failed = true;
        Logger::warn("Probe failed for " + record.file_path + ": " + probed.error_message);
        return false;
    }
    record.container_format_names = probed.media.container_format_names;
    if (probed.media.duration_seconds)
        record.duration_seconds = *probed.media.duration_seconds;
    if (probed.media.size_bytes > 0)
        record.size_bytes = probed.media.size_bytes;
    return true;
}

void CorruptionScanner::scanGeneral(ScanRecord &record) const
{
    // Metadata is informational here; a probe failure does not stop the decode
    probeInto(record);

    DecodeDiagnostics diagnostics = collector_.collectErrors(record.file_path, settings_.decode_timeout_seconds);
    if (diagnostics.process.cancelled || token_.isCancelled())
        throw std::runtime_error("cancelled");
    if (diagnostics.process.exit_code < 0 && !diagnostics.process.timed_out && diagnostics.process.lines_read == 0 &&
        !diagnostics.process.error_message.empty())
    {
        throw std::runtime_error(diagnostics.process.error_message);
    }

    record.classification = classifyDecode(diagnostics.signatures, diagnostics.process,
                                           settings_.nonzero_exit_is_corrupt);
    record.result_text = record.classification.is_corrupt
                             ? joinSignatures(record.classification.matched_signatures)
                             : "No errors";
}

void CorruptionScanner::scanExtension(ScanRecord &record) const
{
    if (!probeInto(record))
    {
        if (token_.isCancelled())
            throw std::runtime_error("cancelled");
        record.result_text = "format undetermined";
        return;
    }

    record.classification.is_corrupt = ContainerMatcher::isMismatch(record.extension, record.container_format_names);
    const std::string joined = joinFormatNames(record.container_format_names);
    if (record.classification.is_corrupt)
    {
        record.classification.matched_signatures.push_back("extension ." + record.extension +
                                                           " does not match container " + joined);
        record.result_text = "Extension mismatch: ." + record.extension + " is " + joined;
    }
    else
    {
        record.result_text = "Extension matches container (" + joined + ")";
    }
}

void CorruptionScanner::scanMoov(ScanRecord &record) const
{
    probeInto(record);

    if (!MoovDetector::isApplicable(record.extension, settings_.moov_extensions))
    {
        record.moov_state = MoovScanState::NotApplicable;
        record.result_text = MoovDetector::describe(record.moov_state);
        return;
    }

    ProcessResult process;
    record.moov_state = collector_.detectMoov(record.file_path, settings_.moov_timeout_seconds, &process);
    if (process.cancelled || token_.isCancelled())
        throw std::runtime_error("cancelled");
    if (process.exit_code < 0 && !process.timed_out && process.lines_read == 0 && !process.error_message.empty())
        throw std::runtime_error(process.error_message);

    record.classification.is_corrupt = MoovDetector::isCorrupt(record.moov_state);
    if (record.classification.is_corrupt)
        record.classification.matched_signatures.push_back(MoovDetector::describe(record.moov_state));
    record.result_text = MoovDetector::describe(record.moov_state);
}

void CorruptionScanner::scanRetrieve(ScanRecord &record) const
{
    if (!probeInto(record))
    {
        if (token_.isCancelled())
            throw std::runtime_error("cancelled");
        record.result_text = "format undetermined";
        return;
    }

    record.result_text = "Container " + joinFormatNames(record.container_format_names) +
                         ", duration " + formatDuration(record.duration_seconds);
}

ScanRecord CorruptionScanner::scanFile(const std::string &file_path, ScanKind kind) const
{
    ScanRecord record = makeRecord(file_path);
    record.classification.scan_kind = kind;

    switch (kind)
    {
    case ScanKind::GeneralCorruption:
        scanGeneral(record);
        break;
    case ScanKind::ContainerExtensionMismatch:
        scanExtension(record);
        break;
    case ScanKind::MoovPosition:
        scanMoov(record);
        break;
    case ScanKind::Retrieve:
        scanRetrieve(record);
        break;
    }
    return record;
}

ScanReport CorruptionScanner::scan(const std::vector<std::string> &files, ScanKind kind,
                                   const ProgressCallback &progress) const
{
    ScanReport report;
    report.scan_kind = kind;

    Logger::info("Starting " + ScanKinds::getKindName(kind) + " scan of " + std::to_string(files.size()) + " file(s)");

    size_t index = 0;
    for (const auto &file : files)
    {
        ++index;
        if (token_.isCancelled())
        {
            report.skipped.emplace_back(file, "cancelled");
            continue;
        }

        try
        {
            ScanRecord record = scanFile(file, kind);
            if (record.classification.is_corrupt)
                Logger::warn("Corrupt: " + file + " (" + record.result_text + ")");
            else
                Logger::info("OK: " + file + " (" + record.result_text + ")");
            if (progress)
                progress(index, files.size(), record);
            report.records.push_back(std::move(record));
        }
        catch (const Poco::Exception &e)
        {
            Logger::error("Scan of " + file + " failed: " + e.displayText());
            report.skipped.emplace_back(file, e.displayText());
        }
        catch (const std::exception &e)
        {
            if (!token_.isCancelled())
                Logger::error("Scan of " + file + " failed: " + e.what());
            report.skipped.emplace_back(file, e.what());
        }
    }

    report.cancelled = token_.isCancelled();
    Logger::info("Scan finished: " + std::to_string(report.records.size()) + " scanned, " +
                 std::to_string(report.corruptCount()) + " corrupt, " + std::to_string(report.skipped.size()) +
                 " skipped" + (report.cancelled ? " (cancelled)" : ""));
    return report;
}
