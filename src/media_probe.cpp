#include "core/media_probe.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/external_process.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <sstream>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace
{
    // ffprobe prints numbers as JSON strings ("12.5"); accept both forms
    std::optional<double> jsonNumber(const nlohmann::json &object, const char *key)
    {
        auto it = object.find(key);
        if (it == object.end() || it->is_null())
            return std::nullopt;
        try
        {
            if (it->is_number())
                return it->get<double>();
            if (it->is_string())
            {
                const std::string text = it->get<std::string>();
                if (text.empty() || text == "N/A")
                    return std::nullopt;
                return std::stod(text);
            }
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
        return std::nullopt;
    }
}

const StreamInfo *MediaProbeResult::firstStream(const std::string &codec_type) const
{
    for (const auto &stream : streams)
    {
        if (stream.codec_type == codec_type)
            return &stream;
    }
    return nullptr;
}

std::string MediaProbeResult::joinedFormatNames() const
{
    std::string joined;
    for (const auto &name : container_format_names)
    {
        if (!joined.empty())
            joined += ",";
        joined += name;
    }
    return joined;
}

MediaProbe::MediaProbe(ProbeBackend backend, std::string ffprobe_path, int timeout_seconds)
    : backend_(backend), ffprobe_path_(std::move(ffprobe_path)), timeout_seconds_(timeout_seconds)
{
}

ProbeResult MediaProbe::probe(const std::string &file_path, bool detail) const
{
    if (!std::filesystem::exists(file_path))
    {
        return ProbeResult(false, "File not found: " + file_path);
    }

    if (backend_ == ProbeBackend::Libavformat)
        return probeWithLibavformat(file_path, detail);
    return probeWithFFprobe(file_path, detail);
}

ProbeResult MediaProbe::probeWithFFprobe(const std::string &file_path, bool detail) const
{
    ToolInvocation invocation;
    invocation.program = ffprobe_path_;
    invocation.args = {"-v", "quiet", "-print_format", "json",
                       "-show_entries", detail ? "format:stream" : "format",
                       "-i", file_path};

    ExternalProcess process(invocation, ExternalProcess::Capture::StdOut);
    process.setTimeout(std::chrono::seconds(timeout_seconds_));
    process.setCancellationToken(token_);

    std::string output;
    ProcessResult run = process.run([&output](const std::string &line)
                                    {
        output += line;
        output += '\n';
        return true; });

    if (!run.success)
    {
        Logger::debug("ffprobe failed for " + file_path + ": " + run.error_message);
        return ProbeResult(false, run.error_message.empty() ? "ffprobe failed" : run.error_message);
    }

    ProbeResult result = parseProbeJson(output, detail);
    if (!result.success)
    {
        Logger::debug("Unparsable ffprobe output for " + file_path + ": " + result.error_message);
    }
    return result;
}

ProbeResult MediaProbe::parseProbeJson(const std::string &json_text, bool detail)
{
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(json_text);
    }
    catch (const nlohmann::json::exception &e)
    {
        return ProbeResult(false, std::string("Invalid ffprobe JSON: ") + e.what());
    }

    if (!document.is_object() || !document.contains("format") || !document["format"].is_object())
    {
        return ProbeResult(false, "ffprobe output has no format section");
    }

    ProbeResult result(true);
    const auto &format = document["format"];
    result.media.container_format_names = splitFormatNames(format.value("format_name", ""));
    result.media.duration_seconds = jsonNumber(format, "duration");
    if (auto size = jsonNumber(format, "size"))
        result.media.size_bytes = *size > 0 ? static_cast<uint64_t>(*size) : 0;

    if (detail && document.contains("streams") && document["streams"].is_array())
    {
        for (const auto &entry : document["streams"])
        {
            std::string codec_type = entry.value("codec_type", "");
            if (codec_type != "video" && codec_type != "audio")
                continue;

            StreamInfo stream;
            stream.index = entry.value("index", 0);
            stream.codec_type = codec_type;
            stream.codec_name = entry.value("codec_name", "");
            if (codec_type == "video")
            {
                stream.frame_rate = parseFrameRate(entry.value("avg_frame_rate", ""));
                if (stream.frame_rate <= 0.0)
                    stream.frame_rate = parseFrameRate(entry.value("r_frame_rate", ""));
            }
            if (auto bit_rate = jsonNumber(entry, "bit_rate"))
                stream.bit_rate = static_cast<int64_t>(*bit_rate);
            result.media.streams.push_back(stream);
        }
    }
    return result;
}

ProbeResult MediaProbe::probeWithLibavformat(const std::string &file_path, bool detail) const
{
    av_log_set_level(AV_LOG_QUIET);

    AVFormatContextRAII ctx;
    int ret = avformat_open_input(ctx.address(), file_path.c_str(), nullptr, nullptr);
    if (ret < 0)
    {
        char error_buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(ret, error_buffer, sizeof(error_buffer));
        return ProbeResult(false, std::string("avformat_open_input failed: ") + error_buffer);
    }

    ret = avformat_find_stream_info(ctx.get(), nullptr);
    if (ret < 0)
    {
        char error_buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(ret, error_buffer, sizeof(error_buffer));
        return ProbeResult(false, std::string("avformat_find_stream_info failed: ") + error_buffer);
    }

    ProbeResult result(true);
    AVFormatContext *fmt = ctx.get();
    if (fmt->iformat && fmt->iformat->name)
        result.media.container_format_names = splitFormatNames(fmt->iformat->name);
    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
        result.media.duration_seconds = static_cast<double>(fmt->duration) / AV_TIME_BASE;

    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    result.media.size_bytes = ec ? 0 : static_cast<uint64_t>(size);

    if (detail)
    {
        for (unsigned int i = 0; i < fmt->nb_streams; ++i)
        {
            const AVStream *st = fmt->streams[i];
            const AVCodecParameters *par = st->codecpar;
            if (par->codec_type != AVMEDIA_TYPE_VIDEO && par->codec_type != AVMEDIA_TYPE_AUDIO)
                continue;

            StreamInfo stream;
            stream.index = st->index;
            stream.codec_type = par->codec_type == AVMEDIA_TYPE_VIDEO ? "video" : "audio";
            stream.codec_name = avcodec_get_name(par->codec_id);
            if (par->codec_type == AVMEDIA_TYPE_VIDEO)
            {
                AVRational rate = st->avg_frame_rate.num > 0 ? st->avg_frame_rate : st->r_frame_rate;
                if (rate.num > 0 && rate.den > 0)
                    stream.frame_rate = av_q2d(rate);
            }
            stream.bit_rate = par->bit_rate;
            result.media.streams.push_back(stream);
        }
    }
    return result;
}

double MediaProbe::parseFrameRate(const std::string &rate)
{
    if (rate.empty())
        return 0.0;
    try
    {
        auto slash = rate.find('/');
        if (slash == std::string::npos)
            return std::stod(rate);
        double num = std::stod(rate.substr(0, slash));
        double den = std::stod(rate.substr(slash + 1));
        if (den <= 0.0)
            return 0.0;
        return num / den;
    }
    catch (const std::exception &)
    {
        return 0.0;
    }
}

std::vector<std::string> MediaProbe::splitFormatNames(const std::string &format_name)
{
    std::vector<std::string> names;
    std::stringstream ss(format_name);
    std::string name;
    while (std::getline(ss, name, ','))
    {
        name.erase(0, name.find_first_not_of(' '));
        name.erase(name.find_last_not_of(' ') + 1);
        if (name.empty())
            continue;
        if (std::find(names.begin(), names.end(), name) == names.end())
            names.push_back(name);
    }
    return names;
}
