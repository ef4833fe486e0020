// Repository: StoryReel
// Component: FFmpeg Media Probe
// Purpose: Container-level inspection (duration, stream presence) using libavformat.
// Copyright (c) 2025 StoryReel

#include "storyreel/decode/FFmpegMediaProbe.h"

#include <sstream>

#include "storyreel/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

namespace storyreel::decode {

using storyreel::util::Logger;

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

// Longest stream duration, for containers that leave the format duration unset.
double LongestStreamDuration(const AVFormatContext* format_ctx) {
  double longest = 0.0;
  for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
    const AVStream* stream = format_ctx->streams[i];
    if (stream->duration == AV_NOPTS_VALUE) continue;
    const double seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    if (seconds > longest) longest = seconds;
  }
  return longest;
}

}  // namespace

std::optional<MediaProbeInfo> FFmpegMediaProbe::Probe(const std::string& uri) {
  AVFormatContext* format_ctx = nullptr;
  int ret = avformat_open_input(&format_ctx, uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegMediaProbe] PROBE_STEP open_input FAILED uri=" << uri
        << " ret=" << ret << " err=" << AvErrorString(ret);
    Logger::Warn(oss.str());
    return std::nullopt;
  }

  ret = avformat_find_stream_info(format_ctx, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[FFmpegMediaProbe] PROBE_STEP find_stream_info FAILED uri=" << uri
        << " ret=" << ret << " err=" << AvErrorString(ret);
    Logger::Warn(oss.str());
    avformat_close_input(&format_ctx);
    return std::nullopt;
  }

  MediaProbeInfo info;
  for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
    const AVCodecParameters* codecpar = format_ctx->streams[i]->codecpar;
    if (codecpar->codec_type == AVMEDIA_TYPE_VIDEO && !info.has_video) {
      info.has_video = true;
      info.width = codecpar->width;
      info.height = codecpar->height;
    } else if (codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
      info.has_audio = true;
    }
  }

  if (format_ctx->duration != AV_NOPTS_VALUE) {
    info.duration_s = static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
  } else {
    info.duration_s = LongestStreamDuration(format_ctx);
  }
  avformat_close_input(&format_ctx);

  if (info.duration_s <= 0.0) {
    Logger::Warn("[FFmpegMediaProbe] PROBE_STEP duration FAILED uri=" + uri +
                 " (no duration reported)");
    return std::nullopt;
  }

  std::ostringstream oss;
  oss << "[FFmpegMediaProbe] PROBE_OK uri=" << uri
      << " duration_s=" << info.duration_s
      << " video=" << (info.has_video ? "Y" : "N")
      << " audio=" << (info.has_audio ? "Y" : "N");
  if (info.has_video) {
    oss << " size=" << info.width << "x" << info.height;
  }
  Logger::Debug(oss.str());
  return info;
}

}  // namespace storyreel::decode
