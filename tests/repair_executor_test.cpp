#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/repair_executor.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    // Writes a marker into the last argument, like ffmpeg writes its output file
    const char *kWritingFFmpeg = "for a in \"$@\"; do last=\"$a\"; done\n"
                                 "echo \"$*\" > \"$last\"";

    // Analyze pass drops the header files into the cwd; extract pass writes both streams
    const char *kRecoverMp4 = "if [ \"$2\" = \"--analyze\" ]; then echo v > video.hdr; echo a > audio.hdr; exit 0; fi\n"
                              "echo h264 > \"$2\"\necho aac > \"$3\"";
}

class RepairExecutorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        settings_.output_dir = pathFor("out");
        settings_.timeout_seconds = 20;
        settings_.probe_timeout_seconds = 20;
        settings_.video_encoder = "libx264";
        settings_.tools.ffmpeg = createScript("bin/ffmpeg", kWritingFFmpeg);
        settings_.tools.recover_mp4 = createScript("bin/recover_mp4", kRecoverMp4);
        settings_.tools.ffprobe = createScript(
            "bin/ffprobe",
            "echo '{\"streams\": [{\"index\": 0, \"codec_type\": \"video\", \"codec_name\": \"h264\", "
            "\"r_frame_rate\": \"25/1\"}], \"format\": {\"format_name\": \"mov,mp4,m4a,3gp,3g2,mj2\", "
            "\"duration\": \"10\"}}'");
    }

    ScanRecord corruptRecord(const std::string &name, std::vector<std::string> signatures)
    {
        ScanRecord record;
        record.file_path = createDummyFile("videos/" + name, "original bytes");
        record.file_name = name;
        record.folder = pathFor("videos");
        record.extension = fs::path(name).extension().string().substr(1);
        record.size_bytes = 14;
        record.classification.is_corrupt = true;
        record.classification.matched_signatures = std::move(signatures);
        return record;
    }

    RepairSettings settings_;
};

TEST_F(RepairExecutorTest, NalUnitRepairProducesBothCandidates)
{
    ScanRecord record = corruptRecord("cam.mp4", {"Invalid NAL unit size", "missing picture in access unit"});

    RepairExecutor executor(settings_);
    RepairOutcome outcome = executor.repair(record, ScanKind::GeneralCorruption);

    ASSERT_EQ(outcome.status, RepairOutcome::Status::Repaired) << outcome.reason;
    EXPECT_EQ(outcome.error_class, ErrorClass::NalUnitSize);
    EXPECT_EQ(outcome.outputs,
              (std::vector<std::string>{pathFor("out/cam-Option01.mp4"), pathFor("out/cam-Option02.mp4")}));
    EXPECT_TRUE(fs::exists(pathFor("out/cam-Option01.mp4")));
    EXPECT_TRUE(fs::exists(pathFor("out/cam-Option02.mp4")));
    // The probed frame rate reaches the remux
    EXPECT_NE(readFile(pathFor("out/cam-Option01.mp4")).find("-r 25"), std::string::npos);
    // The original is untouched
    EXPECT_EQ(readFile(record.file_path), "original bytes");
}

TEST_F(RepairExecutorTest, MissingRecoverMp4FailsNalRepair)
{
    settings_.tools.recover_mp4 = pathFor("bin/no_recover_mp4");
    ScanRecord record = corruptRecord("cam.mp4", {"Invalid NAL unit size"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Failed);
    EXPECT_NE(outcome.reason.find("recover_mp4"), std::string::npos);
}

TEST_F(RepairExecutorTest, SingleOutputRepair)
{
    ScanRecord record = corruptRecord("talk.mkv", {"Header missing"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    ASSERT_TRUE(outcome.success()) << outcome.reason;
    EXPECT_EQ(outcome.error_class, ErrorClass::GenericDecodeFailure);
    ASSERT_EQ(outcome.outputs.size(), 1u);
    EXPECT_EQ(outcome.outputs[0], pathFor("out/talk-Repaired.mkv"));
    EXPECT_NE(readFile(outcome.outputs[0]).find("libx264"), std::string::npos);
}

TEST_F(RepairExecutorTest, UnknownSignatureIsSkipped)
{
    ScanRecord record = corruptRecord("odd.mp4", {"Something nobody has seen before"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Skipped);
    EXPECT_EQ(outcome.reason, "no known repair");
    EXPECT_FALSE(fs::exists(pathFor("out/odd-Repaired.mp4")));
}

TEST_F(RepairExecutorTest, FailingEncoderIsReported)
{
    // Writes part of the output before failing
    settings_.tools.ffmpeg = createScript("bin/ffmpeg_broken",
                                          std::string(kWritingFFmpeg) + "\necho 'Unknown encoder' >&2\nexit 1");
    ScanRecord record = corruptRecord("talk.mkv", {"Header missing"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Failed);
    EXPECT_FALSE(outcome.reason.empty());
    EXPECT_FALSE(fs::exists(pathFor("out/talk-Repaired.mkv")));
}

TEST_F(RepairExecutorTest, FailedSecondStepRemovesFirstCandidate)
{
    // The remux step succeeds, the re-encode from the recovered streams fails
    settings_.tools.ffmpeg = createScript("bin/ffmpeg_half",
                                          std::string(kWritingFFmpeg) + "\ncase \"$last\" in *Option02*) exit 1 ;; esac");
    ScanRecord record = corruptRecord("cam.mp4", {"Invalid NAL unit size"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Failed);
    EXPECT_FALSE(fs::exists(pathFor("out/cam-Option01.mp4")));
    EXPECT_FALSE(fs::exists(pathFor("out/cam-Option02.mp4")));
}

TEST_F(RepairExecutorTest, EmptyOutputIsFailure)
{
    // Creates the output file but never writes to it
    settings_.tools.ffmpeg = createScript("bin/ffmpeg_lazy", "for a in \"$@\"; do last=\"$a\"; done\n: > \"$last\"");
    ScanRecord record = corruptRecord("talk.mkv", {"Header missing"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Failed);
    EXPECT_NE(outcome.reason.find("expected output was not produced"), std::string::npos);
    EXPECT_FALSE(fs::exists(pathFor("out/talk-Repaired.mkv")));
}

TEST_F(RepairExecutorTest, MissingStreamMetadataRepairsWithRecordValues)
{
    settings_.tools.ffprobe = createScript("bin/ffprobe_broken", "exit 1");
    ScanRecord record = corruptRecord("clip.mp4", {"Incomplete frame"});
    record.size_bytes = 5000000;
    record.duration_seconds = 10.0;

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    ASSERT_EQ(outcome.status, RepairOutcome::Status::Repaired) << outcome.reason;
    EXPECT_EQ(outcome.error_class, ErrorClass::IncompleteFrame);
    ASSERT_EQ(outcome.outputs.size(), 1u);
    // 5000000 bytes over 10 seconds
    EXPECT_NE(readFile(outcome.outputs[0]).find("-b:v 4000000"), std::string::npos);
}

TEST_F(RepairExecutorTest, ExtensionFixCopiesUnderProbedExtension)
{
    ScanRecord record = corruptRecord("renamed.avi", {"extension .avi does not match container mov,mp4"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::ContainerExtensionMismatch);
    ASSERT_TRUE(outcome.success()) << outcome.reason;
    ASSERT_EQ(outcome.outputs.size(), 1u);
    EXPECT_EQ(outcome.outputs[0], pathFor("out/renamed.mp4"));
    EXPECT_EQ(readFile(outcome.outputs[0]), "original bytes");
    EXPECT_TRUE(fs::exists(record.file_path));
}

TEST_F(RepairExecutorTest, ExtensionFixWithoutProbeUsesUnknown)
{
    settings_.tools.ffprobe = createScript("bin/ffprobe_broken", "exit 1");
    ScanRecord record = corruptRecord("renamed.avi", {"extension mismatch"});

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::ContainerExtensionMismatch);
    ASSERT_TRUE(outcome.success()) << outcome.reason;
    EXPECT_EQ(outcome.outputs[0], pathFor("out/renamed.avi.unknown"));
}

TEST_F(RepairExecutorTest, MoovAfterMdatGetsFaststartRemux)
{
    ScanRecord record = corruptRecord("upload.mp4", {"moov after mdat, faststart fix available"});
    record.moov_state = MoovScanState::FoundMdat;

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::MoovPosition);
    ASSERT_TRUE(outcome.success()) << outcome.reason;
    EXPECT_EQ(outcome.outputs, std::vector<std::string>{pathFor("out/upload-Faststart.mp4")});
    EXPECT_NE(readFile(outcome.outputs[0]).find("+faststart"), std::string::npos);
}

TEST_F(RepairExecutorTest, MissingMoovHasNoRepair)
{
    ScanRecord record = corruptRecord("truncated.mp4", {"moov not detected"});
    record.moov_state = MoovScanState::NotFound;

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::MoovPosition);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Skipped);
    EXPECT_EQ(outcome.reason, "moov not detected, no known repair");
}

TEST_F(RepairExecutorTest, CleanRecordIsSkipped)
{
    ScanRecord record = corruptRecord("fine.mp4", {});
    record.classification.is_corrupt = false;

    RepairOutcome outcome = RepairExecutor(settings_).repair(record, ScanKind::GeneralCorruption);
    EXPECT_EQ(outcome.status, RepairOutcome::Status::Skipped);
    EXPECT_EQ(outcome.reason, "not corrupt");
}

TEST_F(RepairExecutorTest, RepairAllHandlesOnlyCorruptRecords)
{
    ScanReport report;
    report.scan_kind = ScanKind::GeneralCorruption;
    report.records.push_back(corruptRecord("a.mkv", {"Header missing"}));
    ScanRecord clean = corruptRecord("b.mkv", {});
    clean.classification.is_corrupt = false;
    report.records.push_back(clean);
    report.records.push_back(corruptRecord("c.mp4", {"Something nobody has seen before"}));

    RepairReport result = RepairExecutor(settings_).repairAll(report);
    ASSERT_EQ(result.outcomes.size(), 2u);
    EXPECT_EQ(result.count(RepairOutcome::Status::Repaired), 1u);
    EXPECT_EQ(result.count(RepairOutcome::Status::Skipped), 1u);
    EXPECT_FALSE(result.cancelled);
}

TEST_F(RepairExecutorTest, CancelledRepairDoesNothing)
{
    CancellationToken token;
    token.cancel();
    RepairExecutor executor(settings_);
    executor.setCancellationToken(token);

    ScanReport report;
    report.records.push_back(corruptRecord("a.mkv", {"Header missing"}));
    RepairReport result = executor.repairAll(report);

    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(result.outcomes[0].reason, "cancelled");
    EXPECT_FALSE(fs::exists(pathFor("out/a-Repaired.mkv")));
}
