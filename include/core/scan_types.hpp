#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

/**
 * @brief The four scans a file can be put through
 */
enum class ScanKind
{
    GeneralCorruption,          // full decode, match decoder diagnostics
    ContainerExtensionMismatch, // declared extension vs probed container
    MoovPosition,               // moov before mdat (faststart)
    Retrieve                    // metadata only, never corrupt
};

class ScanKinds
{
public:
    static std::string getKindName(ScanKind kind)
    {
        switch (kind)
        {
        case ScanKind::GeneralCorruption:
            return "general";
        case ScanKind::ContainerExtensionMismatch:
            return "extension";
        case ScanKind::MoovPosition:
            return "moov";
        case ScanKind::Retrieve:
            return "retrieve";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Parse a command line / report name into a scan kind
     * @return std::nullopt for unknown names
     */
    static std::optional<ScanKind> fromString(const std::string &name)
    {
        if (name == "general" || name == "GeneralCorruption")
            return ScanKind::GeneralCorruption;
        if (name == "extension" || name == "ContainerExtensionMismatch")
            return ScanKind::ContainerExtensionMismatch;
        if (name == "moov" || name == "MoovPosition")
            return ScanKind::MoovPosition;
        if (name == "retrieve" || name == "Retrieve")
            return ScanKind::Retrieve;
        return std::nullopt;
    }
};

/**
 * @brief Outcome of the moov/mdat ordering check
 */
enum class MoovScanState
{
    Searching,
    FoundMoov,
    FoundMdat,
    NotFound,
    NotApplicable
};

/**
 * @brief Per-file classification
 *
 * is_corrupt is true iff a signature matched (general), the expected
 * container token is absent (extension), or the first box was mdat or no
 * box was seen (moov).
 */
struct ClassificationResult
{
    bool is_corrupt = false;
    std::vector<std::string> matched_signatures; // deduplicated, first-seen order
    ScanKind scan_kind = ScanKind::GeneralCorruption;
};

/**
 * @brief One row of a scan report
 */
struct ScanRecord
{
    std::string file_path;
    std::string file_name;
    std::string folder;
    std::string extension; // lower case, without the dot
    uint64_t size_bytes = 0;
    double duration_seconds = 0.0;

    ClassificationResult classification;
    std::string result_text;

    bool probe_failed = false;
    std::vector<std::string> container_format_names;
    MoovScanState moov_state = MoovScanState::NotApplicable;
};

/**
 * @brief Immutable result of one scan job
 */
struct ScanReport
{
    ScanKind scan_kind = ScanKind::GeneralCorruption;
    std::vector<ScanRecord> records;
    std::vector<std::pair<std::string, std::string>> skipped; // path, reason
    bool cancelled = false;

    size_t corruptCount() const
    {
        size_t count = 0;
        for (const auto &record : records)
        {
            if (record.classification.is_corrupt)
                count++;
        }
        return count;
    }
};
