#include "core/report_writer.hpp"
#include "core/error_classifier.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <stdexcept>

std::string ReportWriter::escapeCsv(const std::string &field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string quoted = "\"";
    for (char c : field)
    {
        if (c == '"')
            quoted += "\"\"";
        else
            quoted += c;
    }
    quoted += "\"";
    return quoted;
}

std::string ReportWriter::getMoovStateName(MoovScanState state)
{
    switch (state)
    {
    case MoovScanState::Searching:
        return "searching";
    case MoovScanState::FoundMoov:
        return "found_moov";
    case MoovScanState::FoundMdat:
        return "found_mdat";
    case MoovScanState::NotFound:
        return "not_found";
    case MoovScanState::NotApplicable:
    default:
        return "not_applicable";
    }
}

MoovScanState ReportWriter::moovStateFromString(const std::string &name)
{
    if (name == "searching")
        return MoovScanState::Searching;
    if (name == "found_moov")
        return MoovScanState::FoundMoov;
    if (name == "found_mdat")
        return MoovScanState::FoundMdat;
    if (name == "not_found")
        return MoovScanState::NotFound;
    return MoovScanState::NotApplicable;
}

void ReportWriter::writeCsv(const ScanReport &report, std::ostream &out)
{
    out << "Error,FileName,Folder,Extension,SizeBytes,DurationSeconds,Result\n";
    for (const auto &record : report.records)
    {
        out << (record.classification.is_corrupt ? "true" : "false") << ","
            << escapeCsv(record.file_name) << ","
            << escapeCsv(record.folder) << ","
            << escapeCsv(record.extension) << ","
            << record.size_bytes << ","
            << record.duration_seconds << ","
            << escapeCsv(record.result_text) << "\n";
    }
}

bool ReportWriter::writeCsvFile(const ScanReport &report, const std::string &path, std::string &error_message)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        error_message = "Cannot open " + path + " for writing";
        return false;
    }
    writeCsv(report, out);
    if (!out.good())
    {
        error_message = "Write to " + path + " failed";
        return false;
    }
    Logger::info("CSV report written: " + path);
    return true;
}

nlohmann::json ReportWriter::toJson(const ScanReport &report)
{
    nlohmann::json json;
    json["scan_kind"] = ScanKinds::getKindName(report.scan_kind);
    json["cancelled"] = report.cancelled;

    json["records"] = nlohmann::json::array();
    for (const auto &record : report.records)
    {
        nlohmann::json entry;
        entry["file_path"] = record.file_path;
        entry["file_name"] = record.file_name;
        entry["folder"] = record.folder;
        entry["extension"] = record.extension;
        entry["size_bytes"] = record.size_bytes;
        entry["duration_seconds"] = record.duration_seconds;
        entry["is_corrupt"] = record.classification.is_corrupt;
        entry["signatures"] = record.classification.matched_signatures;
        entry["result"] = record.result_text;
        entry["probe_failed"] = record.probe_failed;
        entry["container_format_names"] = record.container_format_names;
        entry["moov_state"] = getMoovStateName(record.moov_state);
        json["records"].push_back(entry);
    }

    json["skipped"] = nlohmann::json::array();
    for (const auto &skipped : report.skipped)
    {
        json["skipped"].push_back({{"file_path", skipped.first}, {"reason", skipped.second}});
    }
    return json;
}

nlohmann::json ReportWriter::toJson(const RepairReport &report)
{
    nlohmann::json json;
    json["cancelled"] = report.cancelled;
    json["outcomes"] = nlohmann::json::array();
    for (const auto &outcome : report.outcomes)
    {
        json["outcomes"].push_back({{"file_path", outcome.file_path},
                                    {"status", RepairOutcome::getStatusName(outcome.status)},
                                    {"rule", ErrorClassifier::getClassName(outcome.error_class)},
                                    {"reason", outcome.reason},
                                    {"outputs", outcome.outputs}});
    }
    return json;
}

ScanReport ReportWriter::fromJson(const nlohmann::json &json)
{
    ScanReport report;
    auto kind = ScanKinds::fromString(json.at("scan_kind").get<std::string>());
    if (!kind)
    {
        throw std::runtime_error("Unknown scan kind in report: " + json.at("scan_kind").get<std::string>());
    }
    report.scan_kind = *kind;
    report.cancelled = json.value("cancelled", false);

    for (const auto &entry : json.at("records"))
    {
        ScanRecord record;
        record.file_path = entry.at("file_path").get<std::string>();
        record.file_name = entry.value("file_name", "");
        record.folder = entry.value("folder", "");
        record.extension = entry.value("extension", "");
        record.size_bytes = entry.value("size_bytes", static_cast<uint64_t>(0));
        record.duration_seconds = entry.value("duration_seconds", 0.0);
        record.classification.scan_kind = report.scan_kind;
        record.classification.is_corrupt = entry.value("is_corrupt", false);
        record.classification.matched_signatures = entry.value("signatures", std::vector<std::string>{});
        record.result_text = entry.value("result", "");
        record.probe_failed = entry.value("probe_failed", false);
        record.container_format_names = entry.value("container_format_names", std::vector<std::string>{});
        record.moov_state = moovStateFromString(entry.value("moov_state", "not_applicable"));
        report.records.push_back(std::move(record));
    }

    if (json.contains("skipped"))
    {
        for (const auto &entry : json.at("skipped"))
        {
            report.skipped.emplace_back(entry.at("file_path").get<std::string>(), entry.value("reason", ""));
        }
    }
    return report;
}

bool ReportWriter::writeJsonFile(const ScanReport &report, const std::string &path, std::string &error_message)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
    {
        error_message = "Cannot open " + path + " for writing";
        return false;
    }
    out << toJson(report).dump(2) << "\n";
    if (!out.good())
    {
        error_message = "Write to " + path + " failed";
        return false;
    }
    Logger::info("JSON report written: " + path);
    return true;
}

ScanReport ReportWriter::readJsonFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw std::runtime_error("Cannot open report " + path);
    }
    try
    {
        nlohmann::json json = nlohmann::json::parse(in);
        return fromJson(json);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error("Malformed report " + path + ": " + e.what());
    }
}
