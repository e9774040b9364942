#include "core/error_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace
{
    const std::regex &dtsStreamPattern()
    {
        static const std::regex pattern("non monotonically increasing dts to muxer in stream \\d+",
                                        std::regex::ECMAScript | std::regex::icase);
        return pattern;
    }

    const std::vector<std::regex> &compiledErrorPatterns()
    {
        static const std::vector<std::regex> compiled = []()
        {
            std::vector<std::regex> patterns;
            for (const auto &pattern : ErrorNormalizer::errorPatterns())
            {
                patterns.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
            }
            return patterns;
        }();
        return compiled;
    }

    bool isNumericToken(const std::string &token)
    {
        static const std::regex numeric(
            "(?:[-+]?(?:0x[0-9a-f]+|\\d+(?:[.:x/]\\d+)*%?)|#\\d+(?::\\d+)*:?|[<>]=?|[!=]=)[,;]?",
            std::regex::ECMAScript | std::regex::icase);
        return std::regex_match(token, numeric);
    }

    std::string trim(const std::string &text, const char *trailing)
    {
        auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        auto last = text.find_last_not_of(trailing);
        if (last == std::string::npos || last < first)
            return "";
        return text.substr(first, last - first + 1);
    }

    bool endsWithIgnoreCase(const std::string &text, const std::string &suffix)
    {
        if (text.size() < suffix.size())
            return false;
        return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(),
                          [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    std::string removeParenthesized(const std::string &text)
    {
        static const std::regex asides("\\([^()]*\\)");
        std::string previous;
        std::string current = text;
        // Nested asides collapse from the inside out
        while (previous != current)
        {
            previous = current;
            current = std::regex_replace(current, asides, " ");
        }
        return current;
    }

    std::string dropNumericTokens(const std::string &text)
    {
        std::istringstream in(text);
        std::string token;
        std::string rebuilt;
        while (in >> token)
        {
            if (isNumericToken(token))
                continue;
            if (!rebuilt.empty())
                rebuilt += ' ';
            rebuilt += token;
        }
        return rebuilt;
    }

    // One pass of the general stripping rules
    std::string stripOnce(const std::string &line)
    {
        std::string text = removeParenthesized(line);

        auto colon = text.rfind(':');
        if (colon != std::string::npos && ErrorNormalizer::isErrorLine(text.substr(0, colon)))
        {
            text.erase(colon);
        }

        text = dropNumericTokens(text);

        static const std::string with_size = " with size";
        while (endsWithIgnoreCase(text, with_size))
        {
            text.erase(text.size() - with_size.size());
            text = trim(text, " \t");
        }

        return trim(text, " \t:.");
    }
}

const std::vector<std::string> &ErrorNormalizer::errorPatterns()
{
    static const std::vector<std::string> patterns = {
        "invalid nal unit size",
        "missing picture in access unit",
        "header missing",
        "error submitting packet to decoder",
        "ac-tex damaged",
        "backstep",
        "cabac decode of qscale diff failed",
        "error while decoding mb",
        "\\blen\\s+(?:-?\\d+\\s+)?invalid",
        "bands.*exceeds limit|exceeds limit.*bands",
        "rematrix is needed",
        "missing amf_end_of_object",
        "incomplete frame",
        "illegal ac vlc code|ac-vlc",
        "packet mismatch",
        "error at mb",
        "concealing",
        "non monotonically increasing dts"};
    return patterns;
}

bool ErrorNormalizer::isErrorLine(const std::string &line)
{
    for (const auto &pattern : compiledErrorPatterns())
    {
        if (std::regex_search(line, pattern))
            return true;
    }
    return false;
}

std::string ErrorNormalizer::stripBracketedPrefix(const std::string &line)
{
    std::string text = line;
    for (;;)
    {
        auto first = text.find_first_not_of(" \t");
        if (first == std::string::npos)
            return "";
        if (text[first] != '[')
            return text.substr(first);
        auto close = text.find(']', first);
        if (close == std::string::npos)
            return text.substr(first);
        text.erase(0, close + 1);
    }
}

std::optional<std::string> ErrorNormalizer::normalize(const std::string &raw_line)
{
    if (!isErrorLine(raw_line))
        return std::nullopt;

    std::string line = stripBracketedPrefix(raw_line);

    std::smatch match;
    if (std::regex_search(line, match, dtsStreamPattern()))
    {
        // The stream index selects the remedy, keep it and the colon after it
        const auto match_end = static_cast<std::string::size_type>(match.position(0) + match.length(0));
        auto colon = line.find(':', match_end);
        std::string signature = colon == std::string::npos ? line.substr(0, match_end) + ":"
                                                           : line.substr(0, colon + 1);
        return trim(signature, " \t");
    }

    // Iterate to a fixed point so normalizing a signature changes nothing.
    // Every effective pass shortens the text.
    std::string current = line;
    for (;;)
    {
        std::string next = stripOnce(current);
        if (next.size() >= current.size())
            break;
        current = std::move(next);
    }

    if (current.empty() || !isErrorLine(current))
        return std::nullopt;
    return current;
}

std::vector<std::string> ErrorNormalizer::normalizeAll(const std::vector<std::string> &raw_lines)
{
    SignatureSet set;
    for (const auto &line : raw_lines)
    {
        set.addRawLine(line);
    }
    return set.signatures();
}

bool SignatureSet::addRawLine(const std::string &raw_line)
{
    auto signature = ErrorNormalizer::normalize(raw_line);
    if (!signature)
        return false;
    return add(*signature);
}

bool SignatureSet::add(const std::string &signature)
{
    if (std::find(signatures_.begin(), signatures_.end(), signature) != signatures_.end())
        return false;
    signatures_.push_back(signature);
    return true;
}
