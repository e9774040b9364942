#pragma once

#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Expands the command line paths into the list of files to scan.
 *
 * Folders contribute the files whose extension is one of the configured
 * video extensions; explicitly named files are always taken.
 */
class FileScanner
{
public:
    explicit FileScanner(std::vector<std::string> video_extensions);
    ~FileScanner() = default;

    // Collect files from a mix of files and folders, in argument order
    std::vector<std::string> collect(const std::vector<std::string> &paths, bool recursive);

    // Scan a directory and collect only video files
    size_t scanDirectory(const std::string &dir_path, bool recursive = false);

    // Add a single file; false if it does not exist
    bool scanFile(const std::string &file_path);

    bool isVideoFile(const std::string &file_path) const;

    const std::vector<std::string> &getFiles() const { return files_; }
    const std::vector<std::pair<std::string, std::string>> &getSkipped() const { return skipped_; }

    // Get scan statistics
    size_t getFilesScanned() const { return files_scanned_; }
    size_t getFilesStored() const { return files_stored_; }
    size_t getFilesSkipped() const { return files_skipped_; }

    // Clear statistics and collected files
    void clearStats();

private:
    std::vector<std::string> video_extensions_;
    std::vector<std::string> files_;
    std::vector<std::pair<std::string, std::string>> skipped_; // path, reason
    size_t files_scanned_;
    size_t files_stored_;
    size_t files_skipped_;

    // Handle individual file during scanning
    void handleFile(const std::string &file_path);
};
