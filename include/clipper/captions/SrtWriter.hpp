// Repository: Clipper
// Component: SRT Writer
// Purpose: Serializes caption cues as SubRip text for sidecar subtitle files.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CAPTIONS_SRT_WRITER_HPP_
#define CLIPPER_CAPTIONS_SRT_WRITER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::captions {

// "HH:MM:SS,mmm"
std::string FormatSrtTimestamp(int64_t ms);

// Cues numbered from 1, blank line between entries.
std::string RenderSrt(const std::vector<timeline::CaptionCue>& cues);

// Atomic write (tmp + rename). Returns false and fills *error on failure.
bool WriteSrtFile(const std::vector<timeline::CaptionCue>& cues,
                  const std::string& path,
                  std::string* error);

}  // namespace clipper::captions

#endif  // CLIPPER_CAPTIONS_SRT_WRITER_HPP_
