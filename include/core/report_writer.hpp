#pragma once

#include "core/repair_executor.hpp"
#include "core/scan_types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

/**
 * @brief CSV and JSON persistence of scan reports
 *
 * The CSV is the flat table users open in a spreadsheet; the JSON keeps the
 * signatures and moov state so a later `repair --from-report` does not
 * need to rescan.
 */
class ReportWriter
{
public:
    // Error,FileName,Folder,Extension,SizeBytes,DurationSeconds,Result
    static void writeCsv(const ScanReport &report, std::ostream &out);
    static bool writeCsvFile(const ScanReport &report, const std::string &path, std::string &error_message);

    static nlohmann::json toJson(const ScanReport &report);
    static nlohmann::json toJson(const RepairReport &report);

    /**
     * @brief Rebuild a scan report from its JSON form
     * @throws nlohmann::json::exception or std::runtime_error on malformed input
     */
    static ScanReport fromJson(const nlohmann::json &json);

    static bool writeJsonFile(const ScanReport &report, const std::string &path, std::string &error_message);

    /**
     * @brief Load a JSON report from disk
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static ScanReport readJsonFile(const std::string &path);

    // RFC 4180 field quoting
    static std::string escapeCsv(const std::string &field);

    static std::string getMoovStateName(MoovScanState state);
    static MoovScanState moovStateFromString(const std::string &name);
};
