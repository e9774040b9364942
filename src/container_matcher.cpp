#include "core/container_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace
{
    // Extensions whose container token is not the extension text itself
    const std::map<std::string, std::vector<std::string>> &exceptionTable()
    {
        static const std::map<std::string, std::vector<std::string>> table = {
            {"wmv", {"asf"}},
            {"wma", {"asf"}},
            {"mkv", {"matroska", "webm"}},
            {"mka", {"matroska", "webm"}},
            {"webm", {"matroska", "webm"}},
            {"mpg", {"mpeg", "mpegvideo"}},
            {"mpeg", {"mpeg", "mpegvideo"}},
            {"vob", {"mpeg"}},
            {"ts", {"mpegts"}},
            {"mts", {"mpegts"}},
            {"m2ts", {"mpegts"}},
            {"m4v", {"mov", "mp4"}},
            {"f4v", {"mov", "mp4"}},
            {"3g2", {"mov", "3g2"}},
            {"ogv", {"ogg"}},
            {"divx", {"avi"}},
            {"rmvb", {"rm"}}};
        return table;
    }
}

std::string ContainerMatcher::normalizeExtension(const std::string &extension)
{
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::vector<std::string> ContainerMatcher::expectedTokens(const std::string &extension)
{
    auto it = exceptionTable().find(normalizeExtension(extension));
    if (it == exceptionTable().end())
        return {};
    return it->second;
}

bool ContainerMatcher::isMismatch(const std::string &extension, const std::vector<std::string> &container_format_names)
{
    const std::string ext = normalizeExtension(extension);

    auto expected = expectedTokens(ext);
    if (!expected.empty())
    {
        for (const auto &name : container_format_names)
        {
            if (std::find(expected.begin(), expected.end(), normalizeExtension(name)) != expected.end())
                return false;
        }
        return true;
    }

    std::string joined;
    for (const auto &name : container_format_names)
    {
        joined += normalizeExtension(name);
        joined += ",";
    }
    return ext.empty() || joined.find(ext) == std::string::npos;
}

std::string ContainerMatcher::chooseExtension(const std::vector<std::string> &candidate_formats)
{
    if (candidate_formats.empty())
        return "unknown";
    if (std::find(candidate_formats.begin(), candidate_formats.end(), "mp4") != candidate_formats.end())
        return "mp4";
    return candidate_formats.front();
}
