#include <gtest/gtest.h>
#include "core/moov_detector.hpp"
#include <string>
#include <vector>

TEST(MoovDetectorTest, MoovBeforeMdatIsFaststart)
{
    std::vector<std::string> lines = {
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] Format mov,mp4,m4a,3gp,3g2,mj2 probed with size=2048 and score=100",
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] type:'ftyp' parent:'root' sz: 32 8 1048576",
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] type:'moov' parent:'root' sz: 3018 40 1048576",
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] type:'mdat' parent:'root' sz: 1045518 3058 1048576"};

    EXPECT_EQ(MoovDetector::detect(lines), MoovScanState::FoundMoov);
    EXPECT_FALSE(MoovDetector::isCorrupt(MoovScanState::FoundMoov));
}

TEST(MoovDetectorTest, MdatFirstIsFlagged)
{
    std::vector<std::string> lines = {
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] type:'ftyp' parent:'root' sz: 32 8 1048576",
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] type:'mdat' parent:'root' sz: 1045518 40 1048576",
        "[mov,mp4,m4a,3gp,3g2,mj2 @ 0x1] type:'moov' parent:'root' sz: 3018 1045558 1048576"};

    EXPECT_EQ(MoovDetector::detect(lines), MoovScanState::FoundMdat);
    EXPECT_TRUE(MoovDetector::isCorrupt(MoovScanState::FoundMdat));
}

TEST(MoovDetectorTest, NoMarkerIsNotFound)
{
    EXPECT_EQ(MoovDetector::detect({"moov atom not found", "Invalid data found when processing input"}),
              MoovScanState::NotFound);
    EXPECT_EQ(MoovDetector::detect({}), MoovScanState::NotFound);
    EXPECT_TRUE(MoovDetector::isCorrupt(MoovScanState::NotFound));
}

TEST(MoovDetectorTest, FeedStopsAtFirstMarker)
{
    MoovDetector detector;
    EXPECT_TRUE(detector.feed("type:'ftyp' parent:'root'"));
    EXPECT_EQ(detector.state(), MoovScanState::Searching);
    EXPECT_FALSE(detector.feed("type:'moov' parent:'root'"));
    EXPECT_EQ(detector.state(), MoovScanState::FoundMoov);

    // Terminal states do not change
    EXPECT_FALSE(detector.feed("type:'mdat' parent:'root'"));
    detector.finish();
    EXPECT_EQ(detector.state(), MoovScanState::FoundMoov);
}

TEST(MoovDetectorTest, OnlyMp4FamilyIsApplicable)
{
    const std::vector<std::string> family = {"mp4", "m4v", "mov", "m4a", "3gp", "3g2"};
    EXPECT_TRUE(MoovDetector::isApplicable("mp4", family));
    EXPECT_TRUE(MoovDetector::isApplicable("3g2", family));
    EXPECT_FALSE(MoovDetector::isApplicable("mkv", family));
    EXPECT_FALSE(MoovDetector::isApplicable("avi", family));
    EXPECT_FALSE(MoovDetector::isCorrupt(MoovScanState::NotApplicable));
    EXPECT_EQ(MoovDetector::describe(MoovScanState::NotApplicable), "Not applicable");
}
