#include "core/file_scanner.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>

FileScanner::FileScanner(std::vector<std::string> video_extensions)
    : video_extensions_(std::move(video_extensions)), files_scanned_(0), files_stored_(0), files_skipped_(0)
{
}

std::vector<std::string> FileScanner::collect(const std::vector<std::string> &paths, bool recursive)
{
    clearStats();
    for (const auto &path : paths)
    {
        if (FileUtils::isValidDirectory(path))
        {
            scanDirectory(path, recursive);
        }
        else if (!scanFile(path))
        {
            Logger::warn("Path not found: " + path);
        }
    }
    return files_;
}

size_t FileScanner::scanDirectory(const std::string &dir_path, bool recursive)
{
    Logger::info("Starting directory scan: " + dir_path + " (recursive: " + (recursive ? "yes" : "no") + ")");
    const size_t stored_before = files_stored_;

    auto file_stream = FileUtils::listFilesAsObservable(dir_path, recursive);
    file_stream.subscribe(
        [this](const std::string &file_path)
        {
            this->handleFile(file_path);
        },
        [this, &dir_path](const std::exception &error)
        {
            Logger::error("Scan error: " + std::string(error.what()));
            skipped_.emplace_back(dir_path, error.what());
        },
        [this, &dir_path, stored_before]()
        {
            Logger::info("Directory scan of " + dir_path + " completed. Video files: " +
                         std::to_string(files_stored_ - stored_before));
        });

    return files_stored_ - stored_before;
}

bool FileScanner::scanFile(const std::string &file_path)
{
    Logger::debug("Scanning single file: " + file_path);

    files_scanned_++;
    if (!FileUtils::isRegularFile(file_path))
    {
        files_skipped_++;
        skipped_.emplace_back(file_path, "not found");
        return false;
    }

    if (std::find(files_.begin(), files_.end(), file_path) == files_.end())
    {
        files_.push_back(file_path);
        files_stored_++;
    }
    return true;
}

bool FileScanner::isVideoFile(const std::string &file_path) const
{
    const std::string ext = FileUtils::getFileExtension(file_path);
    return !ext.empty() && std::find(video_extensions_.begin(), video_extensions_.end(), ext) != video_extensions_.end();
}

void FileScanner::clearStats()
{
    files_.clear();
    skipped_.clear();
    files_scanned_ = 0;
    files_stored_ = 0;
    files_skipped_ = 0;
}

void FileScanner::handleFile(const std::string &file_path)
{
    files_scanned_++;

    // Folder contents are filtered; files named on the command line are not
    if (!isVideoFile(file_path))
    {
        Logger::trace("Skipping non-video file during scan: " + file_path);
        files_skipped_++;
        return;
    }

    if (std::find(files_.begin(), files_.end(), file_path) == files_.end())
    {
        files_.push_back(file_path);
        files_stored_++;
    }
}
