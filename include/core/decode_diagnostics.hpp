#pragma once

#include "core/cancellation_token.hpp"
#include "core/external_process.hpp"
#include "core/scan_types.hpp"
#include <string>
#include <vector>

/**
 * @brief Everything a verify pass produced for one file
 */
struct DecodeDiagnostics
{
    std::vector<std::string> signatures; // normalized, deduplicated, first-seen order
    size_t raw_line_count = 0;
    ProcessResult process;
};

/**
 * @brief Decode Diagnostic Collector.
 *
 * Runs the decoder in verify mode (`-f null -`) and feeds its stderr through
 * the normalizer as it arrives, or through the moov detector with an early
 * stop at the first box marker.
 */
class DecodeDiagnosticCollector
{
public:
    DecodeDiagnosticCollector(std::string ffmpeg_path, std::string hwaccel);

    void setCancellationToken(const CancellationToken &token) { token_ = token; }

    // `ffmpeg -nostdin -hwaccel auto -v error -i <path> -f null -`
    DecodeDiagnostics collectErrors(const std::string &file_path, int timeout_seconds) const;

    /**
     * @brief `ffmpeg -nostdin -v trace -i <path> -f null -`, stopped at the first box marker
     * @param process_out Optional process outcome for logging
     */
    MoovScanState detectMoov(const std::string &file_path, int timeout_seconds,
                             ProcessResult *process_out = nullptr) const;

    ToolInvocation verifyInvocation(const std::string &file_path) const;
    ToolInvocation traceInvocation(const std::string &file_path) const;

private:
    std::string ffmpeg_path_;
    std::string hwaccel_;
    CancellationToken token_;
};
