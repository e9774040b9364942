#pragma once

#include "core/cancellation_token.hpp"
#include "core/error_classifier.hpp"
#include "core/repair_planner.hpp"
#include "core/scan_types.hpp"
#include <string>
#include <vector>

/**
 * @brief Result of repairing one file
 */
struct RepairOutcome
{
    enum class Status
    {
        Repaired,
        Skipped, // not corrupt, or no known repair
        Failed
    };

    std::string file_path;
    Status status = Status::Skipped;
    std::string reason;               // why skipped / failed, or what was done
    std::vector<std::string> outputs; // files written to the output directory
    ErrorClass error_class = ErrorClass::NoKnownRepair;

    bool success() const { return status == Status::Repaired; }

    static std::string getStatusName(Status status);
};

/**
 * @brief Immutable result of one repair job
 */
struct RepairReport
{
    std::vector<RepairOutcome> outcomes;
    bool cancelled = false;

    size_t count(RepairOutcome::Status status) const
    {
        size_t n = 0;
        for (const auto &outcome : outcomes)
        {
            if (outcome.status == status)
                n++;
        }
        return n;
    }
};

/**
 * @brief Runs the remediation for a scanned file.
 *
 * General corruption goes through ErrorClassifier::selectRule and the
 * RepairPlanner; extension mismatches are copied under the probed
 * container's extension; moov-after-mdat files get a faststart remux.
 * The original file is never written to.
 */
class RepairExecutor
{
public:
    explicit RepairExecutor(RepairSettings settings);

    void setCancellationToken(const CancellationToken &token) { token_ = token; }

    /**
     * @brief Repair one record of a scan report
     *
     * Every failure (tool exit status, timeout, missing output, filesystem
     * errors) ends up in the outcome; nothing is thrown.
     */
    RepairOutcome repair(const ScanRecord &record, ScanKind scan_kind) const;

    /**
     * @brief Repair every corrupt record of a scan report, one file at a time
     */
    RepairReport repairAll(const ScanReport &report) const;

    RepairOutcome repairGeneral(const ScanRecord &record) const;
    RepairOutcome fixExtension(const ScanRecord &record) const;
    RepairOutcome fixMoov(const ScanRecord &record) const;

private:
    bool runPlan(const RepairPlan &plan, RepairOutcome &outcome) const;
    bool ensureOutputDirectory(RepairOutcome &outcome) const;

    RepairSettings settings_;
    RepairPlanner planner_;
    CancellationToken token_;
};
