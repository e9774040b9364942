#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/media_probe.hpp"

namespace
{
    const char *kDetailJson = R"({
        "streams": [
            {"index": 0, "codec_name": "h264", "codec_type": "video",
             "r_frame_rate": "30000/1001", "avg_frame_rate": "30000/1001", "bit_rate": "4500000"},
            {"index": 1, "codec_name": "aac", "codec_type": "audio", "bit_rate": "128000"},
            {"index": 2, "codec_name": "bin_data", "codec_type": "data"}
        ],
        "format": {
            "filename": "clip.mp4",
            "format_name": "mov,mp4,m4a,3gp,3g2,mj2",
            "duration": "12.512000",
            "size": "7340032"
        }
    })";
}

TEST(MediaProbeParseTest, ParsesFormatSection)
{
    ProbeResult result = MediaProbe::parseProbeJson(kDetailJson, false);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.media.container_format_names,
              (std::vector<std::string>{"mov", "mp4", "m4a", "3gp", "3g2", "mj2"}));
    ASSERT_TRUE(result.media.duration_seconds.has_value());
    EXPECT_DOUBLE_EQ(*result.media.duration_seconds, 12.512);
    EXPECT_EQ(result.media.size_bytes, 7340032u);
    EXPECT_TRUE(result.media.streams.empty());
    EXPECT_EQ(result.media.joinedFormatNames(), "mov,mp4,m4a,3gp,3g2,mj2");
}

TEST(MediaProbeParseTest, DetailModeKeepsVideoAndAudioOnly)
{
    ProbeResult result = MediaProbe::parseProbeJson(kDetailJson, true);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.media.streams.size(), 2u);

    const StreamInfo *video = result.media.firstStream("video");
    ASSERT_NE(video, nullptr);
    EXPECT_EQ(video->codec_name, "h264");
    EXPECT_NEAR(video->frame_rate, 29.97, 0.01);
    EXPECT_EQ(video->bit_rate, 4500000);

    const StreamInfo *audio = result.media.firstStream("audio");
    ASSERT_NE(audio, nullptr);
    EXPECT_EQ(audio->index, 1);
    EXPECT_EQ(audio->bit_rate, 128000);

    EXPECT_EQ(result.media.firstStream("subtitle"), nullptr);
}

TEST(MediaProbeParseTest, MissingDurationIsEmpty)
{
    ProbeResult result = MediaProbe::parseProbeJson(R"({"format": {"format_name": "mpegts", "duration": "N/A"}})", false);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.media.duration_seconds.has_value());
    EXPECT_EQ(result.media.size_bytes, 0u);
}

TEST(MediaProbeParseTest, UnparsableOutputFails)
{
    EXPECT_FALSE(MediaProbe::parseProbeJson("", false).success);
    EXPECT_FALSE(MediaProbe::parseProbeJson("not json at all", false).success);
    EXPECT_FALSE(MediaProbe::parseProbeJson("{}", false).success);
}

TEST(MediaProbeParseTest, FrameRateParsing)
{
    EXPECT_DOUBLE_EQ(MediaProbe::parseFrameRate("25/1"), 25.0);
    EXPECT_DOUBLE_EQ(MediaProbe::parseFrameRate("24"), 24.0);
    EXPECT_DOUBLE_EQ(MediaProbe::parseFrameRate("0/0"), 0.0);
    EXPECT_DOUBLE_EQ(MediaProbe::parseFrameRate("garbage"), 0.0);
}

TEST(MediaProbeParseTest, FormatNamesAreDeduplicated)
{
    EXPECT_EQ(MediaProbe::splitFormatNames("matroska,webm,matroska"), (std::vector<std::string>{"matroska", "webm"}));
    EXPECT_TRUE(MediaProbe::splitFormatNames("").empty());
}

class MediaProbeProcessTest : public TestBase
{
};

TEST_F(MediaProbeProcessTest, ProbesThroughFFprobeExecutable)
{
    std::string media = createDummyFile("clip.mkv", "not really a video");
    std::string ffprobe = createScript("ffprobe",
                                       "echo '{\"format\": {\"format_name\": \"matroska,webm\", \"duration\": \"3.5\", \"size\": \"18\"}}'");

    MediaProbe probe(ProbeBackend::FFprobe, ffprobe, 10);
    ProbeResult result = probe.probe(media);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.media.container_format_names, (std::vector<std::string>{"matroska", "webm"}));
    EXPECT_DOUBLE_EQ(*result.media.duration_seconds, 3.5);
}

TEST_F(MediaProbeProcessTest, NonZeroExitIsProbeFailure)
{
    std::string media = createDummyFile("broken.mp4", "garbage");
    std::string ffprobe = createScript("ffprobe", "exit 1");

    MediaProbe probe(ProbeBackend::FFprobe, ffprobe, 10);
    ProbeResult result = probe.probe(media);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(MediaProbeProcessTest, MissingFileIsProbeFailure)
{
    MediaProbe probe(ProbeBackend::FFprobe, "/bin/true", 10);
    EXPECT_FALSE(probe.probe(pathFor("does_not_exist.mp4")).success);
}

TEST_F(MediaProbeProcessTest, LibavformatRejectsNonMedia)
{
    std::string text = createDummyFile("notes.mp4", "");
    MediaProbe probe(ProbeBackend::Libavformat, "", 10);
    EXPECT_FALSE(probe.probe(text).success);
}
