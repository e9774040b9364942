#include "core/decode_diagnostics.hpp"
#include "core/error_normalizer.hpp"
#include "core/moov_detector.hpp"
#include "logging/logger.hpp"

DecodeDiagnosticCollector::DecodeDiagnosticCollector(std::string ffmpeg_path, std::string hwaccel)
    : ffmpeg_path_(std::move(ffmpeg_path)), hwaccel_(std::move(hwaccel))
{
}

ToolInvocation DecodeDiagnosticCollector::verifyInvocation(const std::string &file_path) const
{
    ToolInvocation invocation;
    invocation.program = ffmpeg_path_;
    // Never read the terminal, a backgrounded scan would stop on SIGTTIN
    invocation.args = {"-nostdin"};
    // Hardware decoding is advisory; "none" disables it
    if (!hwaccel_.empty() && hwaccel_ != "none")
    {
        invocation.args.insert(invocation.args.end(), {"-hwaccel", hwaccel_});
    }
    invocation.args.insert(invocation.args.end(), {"-v", "error", "-i", file_path, "-f", "null", "-"});
    return invocation;
}

ToolInvocation DecodeDiagnosticCollector::traceInvocation(const std::string &file_path) const
{
    ToolInvocation invocation;
    invocation.program = ffmpeg_path_;
    invocation.args = {"-nostdin", "-v", "trace", "-i", file_path, "-f", "null", "-"};
    return invocation;
}

DecodeDiagnostics DecodeDiagnosticCollector::collectErrors(const std::string &file_path, int timeout_seconds) const
{
    DecodeDiagnostics diagnostics;
    SignatureSet signatures;

    ExternalProcess process(verifyInvocation(file_path), ExternalProcess::Capture::StdErr);
    process.setTimeout(std::chrono::seconds(timeout_seconds));
    process.setCancellationToken(token_);

    diagnostics.process = process.run([&](const std::string &line)
                                      {
        diagnostics.raw_line_count++;
        if (signatures.addRawLine(line))
        {
            Logger::trace("New signature for " + file_path + ": " + signatures.signatures().back());
        }
        return true; });

    diagnostics.signatures = signatures.signatures();
    Logger::debug("Verify pass of " + file_path + ": " + std::to_string(diagnostics.raw_line_count) +
                  " lines, " + std::to_string(diagnostics.signatures.size()) + " signatures");
    return diagnostics;
}

MoovScanState DecodeDiagnosticCollector::detectMoov(const std::string &file_path, int timeout_seconds,
                                                    ProcessResult *process_out) const
{
    MoovDetector detector;

    ExternalProcess process(traceInvocation(file_path), ExternalProcess::Capture::StdErr);
    process.setTimeout(std::chrono::seconds(timeout_seconds));
    process.setCancellationToken(token_);

    ProcessResult result = process.run([&detector](const std::string &line)
                                       { return detector.feed(line); });
    detector.finish();

    if (process_out)
        *process_out = result;
    return detector.state();
}
