// Repository: Clipper
// Component: Media Probe Implementation
// Purpose: Probes media files for duration using FFmpeg
// Copyright (c) 2026 Clipper

#include "clipper/media/MediaProbe.hpp"

#include <chrono>
#include <sstream>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "clipper/util/Logger.hpp"

namespace clipper::media {

bool MediaProbe::Probe(const std::string& path, MediaInfo& out) {
  AVFormatContext* fmt_ctx = nullptr;

  auto open_start = std::chrono::steady_clock::now();
  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    util::Logger::Warn("[MediaProbe] Failed to open: " + path);
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[MediaProbe] Failed to find stream info: " + path);
    return false;
  }
  auto probe_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - open_start).count();

  MediaInfo info;
  info.path = path;
  if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    info.duration_ms = fmt_ctx->duration / 1000;  // AV_TIME_BASE is microseconds
  }
  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVCodecParameters* par = fmt_ctx->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO && !info.has_video) {
      info.has_video = true;
      info.width = par->width;
      info.height = par->height;
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      info.has_audio = true;
    }
  }

  avformat_close_input(&fmt_ctx);

  std::ostringstream oss;
  oss << "[MediaProbe] Probed: " << path << " (" << info.duration_ms << "ms, "
      << info.width << "x" << info.height << ", probe=" << probe_ms << "ms)";
  util::Logger::Debug(oss.str());

  out = std::move(info);
  return true;
}

int64_t MediaProbe::ProbeDurationMs(const std::string& path) {
  MediaInfo info;
  if (!Probe(path, info)) return -1;
  return info.duration_ms > 0 ? info.duration_ms : -1;
}

cache::DurationProbeFn MediaProbe::AsProbeFn() {
  return [](const std::string& path) { return ProbeDurationMs(path); };
}

}  // namespace clipper::media
