#include "core/error_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>

namespace
{
    bool anyOf(const RepairContext &context, std::initializer_list<const char *> needles)
    {
        for (const char *needle : needles)
        {
            if (ErrorClassifier::anySignatureContains(context, needle))
                return true;
        }
        return false;
    }

    bool anyMatches(const RepairContext &context, const std::regex &pattern)
    {
        return std::any_of(context.signatures.begin(), context.signatures.end(),
                           [&pattern](const std::string &signature)
                           { return std::regex_search(signature, pattern); });
    }

    bool matchMpegHeaderAndSubmit(const RepairContext &context)
    {
        return context.extension == "mpg" &&
               ErrorClassifier::anySignatureContains(context, "header missing") &&
               ErrorClassifier::anySignatureContains(context, "error submitting packet to decoder");
    }

    bool matchNalUnitSize(const RepairContext &context)
    {
        // " with size" is stripped by the normalizer
        return anyOf(context, {"invalid nal unit size", "missing picture in access unit"});
    }

    bool matchGenericDecodeFailure(const RepairContext &context)
    {
        static const std::regex len_invalid("\\blen\\s+(?:-?\\d+\\s+)?invalid", std::regex::ECMAScript | std::regex::icase);
        return anyOf(context, {"header missing",
                               "error submitting packet to decoder",
                               "ac-tex damaged",
                               "backstep",
                               "cabac decode of qscale diff failed",
                               "error while decoding mb"}) ||
               anyMatches(context, len_invalid);
    }

    bool matchAacBandLimit(const RepairContext &context)
    {
        return std::any_of(context.signatures.begin(), context.signatures.end(),
                           [](const std::string &signature)
                           { return ErrorClassifier::containsIgnoreCase(signature, "bands") &&
                                    ErrorClassifier::containsIgnoreCase(signature, "exceeds limit"); });
    }

    bool matchRematrixNeeded(const RepairContext &context)
    {
        return ErrorClassifier::anySignatureContains(context, "rematrix is needed");
    }

    bool matchAmfEndOfObject(const RepairContext &context)
    {
        return ErrorClassifier::anySignatureContains(context, "missing amf_end_of_object");
    }

    bool matchIncompleteFrame(const RepairContext &context)
    {
        return ErrorClassifier::anySignatureContains(context, "incomplete frame");
    }

    bool matchMacroblockDamage(const RepairContext &context)
    {
        return anyOf(context, {"error at mb", "concealing", "illegal ac vlc code", "ac-vlc", "packet mismatch"});
    }

    bool matchDtsStream0(const RepairContext &context)
    {
        return ErrorClassifier::anySignatureContains(context, "non monotonically increasing dts to muxer in stream 0:");
    }

    bool matchDtsStream1(const RepairContext &context)
    {
        return ErrorClassifier::anySignatureContains(context, "non monotonically increasing dts to muxer in stream 1:");
    }
}

const std::vector<RepairRule> &ErrorClassifier::rules()
{
    static const std::vector<RepairRule> table = {
        {ErrorClass::MpegHeaderAndSubmit, "mpeg-header-and-submit", &matchMpegHeaderAndSubmit},
        {ErrorClass::NalUnitSize, "nal-unit-size", &matchNalUnitSize},
        {ErrorClass::GenericDecodeFailure, "generic-decode-failure", &matchGenericDecodeFailure},
        {ErrorClass::AacBandLimit, "aac-band-limit", &matchAacBandLimit},
        {ErrorClass::RematrixNeeded, "rematrix-needed", &matchRematrixNeeded},
        {ErrorClass::AmfEndOfObject, "amf-end-of-object", &matchAmfEndOfObject},
        {ErrorClass::IncompleteFrame, "incomplete-frame", &matchIncompleteFrame},
        {ErrorClass::MacroblockDamage, "macroblock-damage", &matchMacroblockDamage},
        {ErrorClass::DtsStream0, "dts-stream-0", &matchDtsStream0},
        {ErrorClass::DtsStream1, "dts-stream-1", &matchDtsStream1}};
    return table;
}

ClassificationResult ErrorClassifier::classify(const std::vector<std::string> &signatures)
{
    ClassificationResult result;
    result.scan_kind = ScanKind::GeneralCorruption;
    result.matched_signatures = signatures;
    result.is_corrupt = !signatures.empty();
    return result;
}

ErrorClass ErrorClassifier::selectRule(const RepairContext &context)
{
    for (const auto &rule : rules())
    {
        if (rule.matches(context))
            return rule.error_class;
    }
    return ErrorClass::NoKnownRepair;
}

std::string ErrorClassifier::getClassName(ErrorClass error_class)
{
    if (error_class == ErrorClass::NoKnownRepair)
        return "no-known-repair";
    for (const auto &rule : rules())
    {
        if (rule.error_class == error_class)
            return rule.name;
    }
    return "unknown";
}

bool ErrorClassifier::containsIgnoreCase(const std::string &text, const std::string &needle)
{
    auto it = std::search(text.begin(), text.end(), needle.begin(), needle.end(),
                          [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    return it != text.end() || needle.empty();
}

bool ErrorClassifier::anySignatureContains(const RepairContext &context, const std::string &needle)
{
    return std::any_of(context.signatures.begin(), context.signatures.end(),
                       [&needle](const std::string &signature)
                       { return containsIgnoreCase(signature, needle); });
}
