#pragma once

#include "core/scan_types.hpp"
#include <string>
#include <vector>

/**
 * @brief Moov Position Detector.
 *
 * Fed the `ffmpeg -v trace` stream line by line. The first line carrying a
 * `type:'moov'` or `type:'mdat'` marker decides; end of stream without one
 * is NotFound. All three outcomes are terminal.
 */
class MoovDetector
{
public:
    /**
     * @brief Consume one diagnostic line
     * @return true while still searching, false once a terminal state is reached
     */
    bool feed(const std::string &line);

    // End of stream: Searching becomes NotFound
    void finish();

    MoovScanState state() const { return state_; }

    /**
     * @brief Run a whole stream through a fresh detector
     */
    static MoovScanState detect(const std::vector<std::string> &lines);

    /**
     * @brief Only MP4-family files are checked
     * @param extension Lower case extension without the dot
     * @param moov_extensions Configured MP4-family extensions
     */
    static bool isApplicable(const std::string &extension, const std::vector<std::string> &moov_extensions);

    // FoundMdat and NotFound are corrupt; FoundMoov and NotApplicable are not
    static bool isCorrupt(MoovScanState state);

    static std::string describe(MoovScanState state);

private:
    MoovScanState state_ = MoovScanState::Searching;
};
