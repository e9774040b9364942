#pragma once

#include <string>
#include <vector>

/**
 * @brief Container/Extension Matcher.
 *
 * Extensions whose container token differs from the extension text
 * (".wmv" is "asf", ".mkv" is "matroska,webm") live in a static exception
 * table; everything else must appear as a substring of the probed names.
 */
class ContainerMatcher
{
public:
    /**
     * @brief Decide whether the declared extension disagrees with the container
     * @param extension Declared extension, with or without the dot, any case
     * @param container_format_names Probed names, e.g. {"mov","mp4","m4a"}
     * @return true on mismatch
     */
    static bool isMismatch(const std::string &extension, const std::vector<std::string> &container_format_names);

    /**
     * @brief Expected container tokens for an extension in the exception table
     * @return Empty if the extension is not in the table
     */
    static std::vector<std::string> expectedTokens(const std::string &extension);

    /**
     * @brief Extension to rename a mismatched file to
     * @param candidate_formats Canonical format list from a re-probe
     * @return "mp4" if present, else the first candidate, else "unknown"
     */
    static std::string chooseExtension(const std::vector<std::string> &candidate_formats);

    static std::string normalizeExtension(const std::string &extension);
};
