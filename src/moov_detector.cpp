#include "core/moov_detector.hpp"
#include <algorithm>

namespace
{
    const char *kMoovMarker = "type:'moov'";
    const char *kMdatMarker = "type:'mdat'";
}

bool MoovDetector::feed(const std::string &line)
{
    if (state_ != MoovScanState::Searching)
        return false;

    if (line.find(kMoovMarker) != std::string::npos)
    {
        state_ = MoovScanState::FoundMoov;
        return false;
    }
    if (line.find(kMdatMarker) != std::string::npos)
    {
        state_ = MoovScanState::FoundMdat;
        return false;
    }
    return true;
}

void MoovDetector::finish()
{
    if (state_ == MoovScanState::Searching)
        state_ = MoovScanState::NotFound;
}

MoovScanState MoovDetector::detect(const std::vector<std::string> &lines)
{
    MoovDetector detector;
    for (const auto &line : lines)
    {
        if (!detector.feed(line))
            break;
    }
    detector.finish();
    return detector.state();
}

bool MoovDetector::isApplicable(const std::string &extension, const std::vector<std::string> &moov_extensions)
{
    return std::find(moov_extensions.begin(), moov_extensions.end(), extension) != moov_extensions.end();
}

bool MoovDetector::isCorrupt(MoovScanState state)
{
    return state == MoovScanState::FoundMdat || state == MoovScanState::NotFound;
}

std::string MoovDetector::describe(MoovScanState state)
{
    switch (state)
    {
    case MoovScanState::FoundMoov:
        return "Faststart: moov before mdat";
    case MoovScanState::FoundMdat:
        return "moov after mdat, faststart fix available";
    case MoovScanState::NotFound:
        return "moov not detected";
    case MoovScanState::NotApplicable:
        return "Not applicable";
    case MoovScanState::Searching:
    default:
        return "Searching";
    }
}
