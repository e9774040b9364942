#pragma once

#include "core/scan_types.hpp"
#include <string>
#include <vector>

/**
 * @brief Repair classes, in dispatch priority order.
 *
 * The enumerator order is the rule table order: the first class whose
 * predicate matches wins, so an "Invalid NAL unit size" file is never
 * treated as a generic "Header missing" one.
 */
enum class ErrorClass
{
    MpegHeaderAndSubmit,  // .mpg with both "header missing" and "error submitting packet"
    NalUnitSize,          // NAL unit recovery, two candidate outputs
    GenericDecodeFailure, // re-encode video with the selected encoder
    AacBandLimit,         // audio to AAC at the source bitrate
    RematrixNeeded,       // audio to AAC at 192k
    AmfEndOfObject,       // remux with larger probe buffers
    IncompleteFrame,      // re-encode video at size*8/duration
    MacroblockDamage,     // re-encode video and audio
    DtsStream0,           // regenerate pts, re-encode video
    DtsStream1,           // regenerate pts, re-encode audio
    NoKnownRepair
};

/**
 * @brief What the dispatcher sees of a checked file
 */
struct RepairContext
{
    std::string extension; // lower case, no dot
    std::vector<std::string> signatures;
};

/**
 * @brief One entry of the static, ordered rule table
 */
struct RepairRule
{
    ErrorClass error_class;
    const char *name;
    bool (*matches)(const RepairContext &context);
};

/**
 * @brief Error Classifier / Repair Dispatcher
 */
class ErrorClassifier
{
public:
    /**
     * @brief Classify a general corruption scan
     * @param signatures Normalized signature set of the file
     * @return is_corrupt iff at least one signature survived normalization
     */
    static ClassificationResult classify(const std::vector<std::string> &signatures);

    /**
     * @brief Pick the single repair rule for a file
     *
     * The rule table is iterated outermost, so the answer does not depend on
     * the order of the signatures.
     */
    static ErrorClass selectRule(const RepairContext &context);

    static const std::vector<RepairRule> &rules();

    static std::string getClassName(ErrorClass error_class);

    // Case-insensitive substring test, shared with the rule predicates
    static bool containsIgnoreCase(const std::string &text, const std::string &needle);
    static bool anySignatureContains(const RepairContext &context, const std::string &needle);
};
