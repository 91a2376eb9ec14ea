// Repository: Clipper
// Component: SRT Writer Implementation
// Copyright (c) 2026 Clipper

#include "clipper/captions/SrtWriter.hpp"

#include <cstdio>
#include <sstream>

#include "clipper/util/AtomicFile.hpp"

namespace clipper::captions {

std::string FormatSrtTimestamp(int64_t ms) {
  if (ms < 0) ms = 0;
  const int64_t hours = ms / 3600000;
  const int64_t minutes = (ms / 60000) % 60;
  const int64_t seconds = (ms / 1000) % 60;
  const int64_t millis = ms % 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld",
                static_cast<long long>(hours), static_cast<long long>(minutes),
                static_cast<long long>(seconds), static_cast<long long>(millis));
  return buf;
}

std::string RenderSrt(const std::vector<timeline::CaptionCue>& cues) {
  std::ostringstream out;
  for (size_t i = 0; i < cues.size(); ++i) {
    const auto& cue = cues[i];
    if (i > 0) out << "\n";
    out << (i + 1) << "\n"
        << FormatSrtTimestamp(cue.start_ms()) << " --> "
        << FormatSrtTimestamp(cue.end_ms()) << "\n"
        << cue.Text() << "\n";
  }
  return out.str();
}

bool WriteSrtFile(const std::vector<timeline::CaptionCue>& cues,
                  const std::string& path,
                  std::string* error) {
  return util::WriteFileAtomically(path, RenderSrt(cues), error);
}

}  // namespace clipper::captions
