#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Error Line Normalizer.
 *
 * Turns one raw decoder diagnostic line into zero or one error signature:
 *  1. lines without an ErrorsToMatch keyword are dropped
 *  2. leading "[module @ 0x...]" tags are removed
 *  3. "non monotonically increasing dts to muxer in stream N" keeps
 *     "stream N:" and drops the payload after that colon
 *  4. otherwise the text from the last colon on, parenthesized asides,
 *     isolated numeric tokens, trailing numerics and a trailing " with size"
 *     are removed
 *  5. whitespace and trailing ":. " are trimmed
 *
 * normalize(normalize(x)) == normalize(x) for every recognized line.
 */
class ErrorNormalizer
{
public:
    static std::optional<std::string> normalize(const std::string &raw_line);

    /**
     * @brief Normalize a whole diagnostic stream
     * @return Deduplicated signatures in first-seen order
     */
    static std::vector<std::string> normalizeAll(const std::vector<std::string> &raw_lines);

    // True if the line contains one of the ErrorsToMatch keywords
    static bool isErrorLine(const std::string &line);

    // ErrorsToMatch, as case-insensitive patterns
    static const std::vector<std::string> &errorPatterns();

    static std::string stripBracketedPrefix(const std::string &line);
};

/**
 * @brief Accumulates signatures with set semantics and first-seen order
 */
class SignatureSet
{
public:
    // Normalize and add a raw line; returns true if a new signature was added
    bool addRawLine(const std::string &raw_line);
    bool add(const std::string &signature);

    const std::vector<std::string> &signatures() const { return signatures_; }
    bool empty() const { return signatures_.empty(); }
    size_t size() const { return signatures_.size(); }

private:
    std::vector<std::string> signatures_;
};
