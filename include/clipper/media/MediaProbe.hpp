// Repository: Clipper
// Component: Media Probe
// Purpose: Reads container duration of avatar tracks and B-roll clips with
//          libavformat.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_MEDIA_MEDIA_PROBE_HPP_
#define CLIPPER_MEDIA_MEDIA_PROBE_HPP_

#include <cstdint>
#include <string>

#include "clipper/cache/ClipSource.hpp"

namespace clipper::media {

struct MediaInfo {
  std::string path;
  int64_t duration_ms = -1;
  bool has_video = false;
  bool has_audio = false;
  int32_t width = 0;
  int32_t height = 0;
};

class MediaProbe {
 public:
  // Returns false (and logs) if the file cannot be opened or has no stream info.
  static bool Probe(const std::string& path, MediaInfo& out);

  // Duration in ms, or -1 when unreadable or when duration is unknown.
  static int64_t ProbeDurationMs(const std::string& path);

  static cache::DurationProbeFn AsProbeFn();
};

}  // namespace clipper::media

#endif  // CLIPPER_MEDIA_MEDIA_PROBE_HPP_
