#pragma once

#include "core/cancellation_token.hpp"
#include "core/decode_diagnostics.hpp"
#include "core/media_probe.hpp"
#include "core/scan_settings.hpp"
#include "core/scan_types.hpp"
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Runs one scan kind over a batch of files and builds the report.
 *
 * Each file gets its own record; a file that cannot be scanned at all
 * (decoder failed to launch, scan cancelled) is listed as skipped with its
 * reason. One bad file never stops the batch.
 */
class CorruptionScanner
{
public:
    // Called after every file: index (1-based), total, record
    using ProgressCallback = std::function<void(size_t, size_t, const ScanRecord &)>;

    explicit CorruptionScanner(ScanSettings settings);

    void setCancellationToken(const CancellationToken &token);

    ScanReport scan(const std::vector<std::string> &files, ScanKind kind,
                    const ProgressCallback &progress = nullptr) const;

    /**
     * @brief Scan a single file
     * @throws std::runtime_error when the file could not be scanned
     */
    ScanRecord scanFile(const std::string &file_path, ScanKind kind) const;

    /**
     * @brief Corrupt verdict when the decoder failed without a recognized error line
     *
     * With nonzero_exit_is_corrupt set, a timeout adds "decode timed out" and a
     * non-zero exit adds "decoder exited with status N" to the signatures.
     */
    static ClassificationResult classifyDecode(const std::vector<std::string> &signatures,
                                               const ProcessResult &process, bool nonzero_exit_is_corrupt);

    // File name, folder, extension and size of a path
    static ScanRecord makeRecord(const std::string &file_path);

private:
    void scanGeneral(ScanRecord &record) const;
    void scanExtension(ScanRecord &record) const;
    void scanMoov(ScanRecord &record) const;
    void scanRetrieve(ScanRecord &record) const;

    // Fills size, duration and format names; returns false on ProbeFailed
    bool probeInto(ScanRecord &record) const;

    ScanSettings settings_;
    MediaProbe probe_;
    DecodeDiagnosticCollector collector_;
    CancellationToken token_;
};
