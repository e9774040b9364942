#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

    void subscribe(Observer onNext)
    {
        subscribe(onNext, nullptr, nullptr);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief File utilities for scanning folders
 */
class FileUtils
{
public:
    /**
     * Lists all files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each file
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    static bool isRegularFile(const std::string &path);

    /**
     * Lower case extension without the dot ("Clip.MP4" -> "mp4")
     */
    static std::string getFileExtension(const std::string &file_path);

    // 0 if the file cannot be stat'ed
    static uint64_t getFileSize(const std::string &file_path);

private:
    static SimpleObservable<std::string> listFilesInternal(const std::string &dir_path, bool recursive);
};
