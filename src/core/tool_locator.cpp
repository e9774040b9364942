#include "core/tool_locator.hpp"
#include "logging/logger.hpp"
#include <Poco/Environment.h>
#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <sstream>

namespace
{
    bool isExecutableFile(const std::string &path)
    {
        try
        {
            Poco::File file(path);
            return file.exists() && file.isFile() && file.canExecute();
        }
        catch (const Poco::Exception &e)
        {
            Logger::debug("Cannot inspect " + path + ": " + e.displayText());
            return false;
        }
    }
}

std::string ToolLocator::resolve(const std::string &tool)
{
    if (tool.empty())
        return "";

    // Explicit paths are checked as given
    if (tool.find('/') != std::string::npos)
    {
        return isExecutableFile(tool) ? tool : "";
    }

    std::string search_path = Poco::Environment::get("PATH", "");
    std::stringstream ss(search_path);
    std::string dir;
    while (std::getline(ss, dir, Poco::Path::pathSeparator()))
    {
        if (dir.empty())
            continue;
        Poco::Path candidate(dir);
        candidate.makeDirectory();
        candidate.setFileName(tool);
        if (isExecutableFile(candidate.toString()))
        {
            return candidate.toString();
        }
    }
    return "";
}

std::vector<ToolStatus> ToolLocator::checkDependencies(const ToolPaths &tools, bool need_ffprobe)
{
    std::vector<ToolStatus> statuses;

    auto check = [&statuses](const std::string &name, const std::string &configured, bool required)
    {
        ToolStatus status;
        status.name = name;
        status.configured = configured;
        status.required = required;
        status.resolved_path = resolve(configured);
        if (status.found())
        {
            Logger::debug("Found " + name + ": " + status.resolved_path);
        }
        else if (required)
        {
            Logger::error("Required tool not found: " + name + " (" + configured + ")");
        }
        else
        {
            Logger::warn("Optional tool not found: " + name + " (" + configured + ")");
        }
        statuses.push_back(status);
    };

    check("ffmpeg", tools.ffmpeg, true);
    check("ffprobe", tools.ffprobe, need_ffprobe);
    // Only the NAL unit recovery repair needs it
    check("recover_mp4", tools.recover_mp4, false);
    return statuses;
}

bool ToolLocator::allRequiredFound(const std::vector<ToolStatus> &statuses)
{
    for (const auto &status : statuses)
    {
        if (status.required && !status.found())
            return false;
    }
    return true;
}

ToolPaths ToolLocator::resolveAll(const ToolPaths &tools)
{
    ToolPaths resolved = tools;
    auto apply = [](std::string &tool)
    {
        std::string path = resolve(tool);
        if (!path.empty())
            tool = path;
    };
    apply(resolved.ffmpeg);
    apply(resolved.ffprobe);
    apply(resolved.recover_mp4);
    return resolved;
}
