#include "core/repair_planner.hpp"
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

RepairPlanner::RepairPlanner(RepairSettings settings)
    : settings_(std::move(settings))
{
}

ToolInvocation RepairPlanner::ffmpeg(std::vector<std::string> args) const
{
    ToolInvocation invocation;
    invocation.program = settings_.tools.ffmpeg;
    invocation.args = {"-y", "-hide_banner", "-nostdin"};
    invocation.args.insert(invocation.args.end(), args.begin(), args.end());
    return invocation;
}

std::string RepairPlanner::outputPath(const std::string &input_path, const std::string &suffix,
                                      const std::string &extension) const
{
    fs::path input(input_path);
    std::string ext = extension.empty() ? input.extension().string() : "." + extension;
    std::string name = input.stem().string();
    if (!suffix.empty())
        name += "-" + suffix;
    return (fs::path(settings_.output_dir) / (name + ext)).string();
}

int64_t RepairPlanner::bitrateFromSize(uint64_t size_bytes, const std::optional<double> &duration_seconds)
{
    if (!duration_seconds || *duration_seconds <= 0.0 || size_bytes == 0)
        return 0;
    return static_cast<int64_t>(std::llround(static_cast<double>(size_bytes) * 8.0 / *duration_seconds));
}

std::string RepairPlanner::formatFrameRate(double frame_rate)
{
    std::ostringstream stream;
    stream << std::setprecision(6) << frame_rate;
    return stream.str();
}

RepairPlan RepairPlanner::planFaststart(const std::string &input_path) const
{
    RepairPlan plan;
    plan.error_class = ErrorClass::NoKnownRepair;
    std::string output = outputPath(input_path, "Faststart");
    plan.steps.push_back({"move moov atom to the front",
                          ffmpeg({"-i", input_path, "-map", "0", "-c", "copy", "-movflags", "+faststart", output})});
    plan.outputs.push_back(output);
    return plan;
}

void RepairPlanner::planNalRecovery(RepairPlan &plan, const std::string &input_path,
                                    const MediaProbeResult &media, const std::string &work_dir) const
{
    plan.needs_recover_mp4 = true;

    const std::string stem = fs::path(input_path).stem().string();
    const std::string h264 = (fs::path(work_dir) / (stem + ".h264")).string();
    const std::string aac = (fs::path(work_dir) / (stem + ".aac")).string();

    // recover_mp4 writes its analysis (video.hdr, audio.hdr) into the working directory
    ToolInvocation analyze;
    analyze.program = settings_.tools.recover_mp4;
    analyze.args = {input_path, "--analyze"};
    analyze.working_directory = work_dir;
    plan.steps.push_back({"analyze damaged stream", analyze});

    ToolInvocation recover;
    recover.program = settings_.tools.recover_mp4;
    recover.args = {input_path, h264, aac};
    recover.working_directory = work_dir;
    plan.steps.push_back({"extract raw video and audio", recover});

    plan.intermediates = {h264, aac,
                          (fs::path(work_dir) / "video.hdr").string(),
                          (fs::path(work_dir) / "audio.hdr").string()};

    std::vector<std::string> rate;
    const StreamInfo *video = media.firstStream("video");
    if (video && video->frame_rate > 0.0)
        rate = {"-r", formatFrameRate(video->frame_rate)};

    const std::string option01 = outputPath(input_path, "Option01", "mp4");
    std::vector<std::string> copy_args = rate;
    copy_args.insert(copy_args.end(), {"-i", h264, "-i", aac, "-c:v", "copy", "-c:a", "copy",
                                       "-movflags", "+faststart", option01});
    plan.steps.push_back({"remux recovered streams", ffmpeg(copy_args)});

    const std::string option02 = outputPath(input_path, "Option02", "mp4");
    std::vector<std::string> encode_args = rate;
    encode_args.insert(encode_args.end(), {"-i", h264, "-i", aac, "-c:v", settings_.video_encoder, "-c:a", "aac",
                                           "-movflags", "+faststart", option02});
    plan.steps.push_back({"re-encode recovered streams", ffmpeg(encode_args)});

    plan.outputs = {option01, option02};
}

RepairPlan RepairPlanner::plan(ErrorClass error_class, const std::string &input_path,
                               const MediaProbeResult &media, const std::string &work_dir) const
{
    RepairPlan plan;
    plan.error_class = error_class;

    const std::string &encoder = settings_.video_encoder;
    const StreamInfo *video = media.firstStream("video");
    const StreamInfo *audio = media.firstStream("audio");
    const int64_t audio_bitrate = audio ? audio->bit_rate : 0;
    const double frame_rate = video ? video->frame_rate : 0.0;

    std::string output = outputPath(input_path, "Repaired");
    std::vector<std::string> args;

    switch (error_class)
    {
    case ErrorClass::MpegHeaderAndSubmit:
        output = outputPath(input_path, "Repaired", "mpg");
        args = {"-err_detect", "ignore_err", "-i", input_path,
                "-c:v", "mpeg2video", "-b:v", "8000k", "-c:a", "libmp3lame", "-b:a", "192k", output};
        plan.steps.push_back({"re-encode as MPEG-2 / MP3", ffmpeg(args)});
        break;

    case ErrorClass::NalUnitSize:
        planNalRecovery(plan, input_path, media, work_dir);
        return plan;

    case ErrorClass::GenericDecodeFailure:
        args = {"-err_detect", "ignore_err", "-i", input_path,
                "-c:v", encoder, "-c:a", "copy", "-movflags", "+faststart", output};
        plan.steps.push_back({"re-encode video", ffmpeg(args)});
        break;

    case ErrorClass::AacBandLimit:
        args = {"-i", input_path, "-c:v", "copy", "-c:a", "aac"};
        if (audio_bitrate > 0)
            args.insert(args.end(), {"-b:a", std::to_string(audio_bitrate)});
        args.push_back(output);
        plan.steps.push_back({"re-encode audio to AAC at source bitrate", ffmpeg(args)});
        break;

    case ErrorClass::RematrixNeeded:
        args = {"-i", input_path, "-c:v", "copy", "-c:a", "aac", "-b:a", "192k", output};
        plan.steps.push_back({"re-encode audio to AAC", ffmpeg(args)});
        break;

    case ErrorClass::AmfEndOfObject:
        args = {"-probesize", "100M", "-analyzeduration", "100M", "-i", input_path, "-c", "copy", output};
        plan.steps.push_back({"remux with enlarged probe buffers", ffmpeg(args)});
        break;

    case ErrorClass::IncompleteFrame:
    {
        args = {"-i", input_path, "-c:v", encoder};
        const int64_t video_bitrate = bitrateFromSize(media.size_bytes, media.duration_seconds);
        if (video_bitrate > 0)
            args.insert(args.end(), {"-b:v", std::to_string(video_bitrate)});
        args.insert(args.end(), {"-c:a", "aac", "-af", "aresample=async=0", output});
        plan.steps.push_back({"re-encode video at size-derived bitrate", ffmpeg(args)});
        break;
    }

    case ErrorClass::MacroblockDamage:
        args = {"-err_detect", "ignore_err", "-i", input_path, "-c:v", encoder, "-c:a", "aac", output};
        plan.steps.push_back({"re-encode video and audio", ffmpeg(args)});
        break;

    case ErrorClass::DtsStream0:
        args = {"-fflags", "+genpts", "-i", input_path, "-c:v", encoder};
        if (frame_rate > 0.0)
            args.insert(args.end(), {"-r", formatFrameRate(frame_rate)});
        args.insert(args.end(), {"-c:a", "copy", "-movflags", "+faststart", output});
        plan.steps.push_back({"regenerate timestamps, re-encode video", ffmpeg(args)});
        break;

    case ErrorClass::DtsStream1:
        args = {"-fflags", "+genpts+igndts", "-i", input_path, "-c:v", "copy", "-c:a", "aac"};
        if (audio_bitrate > 0)
            args.insert(args.end(), {"-b:a", std::to_string(audio_bitrate)});
        args.insert(args.end(), {"-movflags", "+faststart", output});
        plan.steps.push_back({"regenerate timestamps, re-encode audio", ffmpeg(args)});
        break;

    case ErrorClass::NoKnownRepair:
    default:
        return plan;
    }

    plan.outputs.push_back(output);
    return plan;
}
