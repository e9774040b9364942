#include "core/file_utils.hpp"
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include "logging/logger.hpp"

namespace fs = std::filesystem;

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    return listFilesInternal(dir_path, recursive);
}

SimpleObservable<std::string> FileUtils::listFilesInternal(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    // Validate directory exists
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        // Directory entries come in filesystem order; sort for stable reports
                        std::vector<std::string> files;
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                files.push_back(entry.path().string());
                            }
                        }
                        std::sort(files.begin(), files.end());
                        for (const auto &file : files)
                        {
                            onNext(file);
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

bool FileUtils::isRegularFile(const std::string &path)
{
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

uint64_t FileUtils::getFileSize(const std::string &file_path)
{
    std::error_code ec;
    auto size = fs::file_size(fs::path(file_path), ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            std::vector<fs::path> files;
            std::vector<fs::path> subdirectories;
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        files.push_back(entry.path());
                    }
                    else if (entry.is_directory())
                    {
                        subdirectories.push_back(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    // Log the error but continue scanning
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
            std::sort(files.begin(), files.end());
            std::sort(subdirectories.begin(), subdirectories.end());
            for (const auto &file : files)
            {
                onNext(file.string());
            }
            for (const auto &subdirectory : subdirectories)
            {
                scanDirectory(subdirectory);
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Log the error but don't stop the entire scan
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}
