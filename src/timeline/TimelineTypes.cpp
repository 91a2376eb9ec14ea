// Repository: Clipper
// Component: Timeline Types Implementation
// Copyright (c) 2026 Clipper

#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::timeline {

const char* PlanErrorToString(PlanError error) {
  switch (error) {
    case PlanError::kNone:              return "NONE";
    case PlanError::kOverlap:           return "OVERLAP";
    case PlanError::kOutOfRange:        return "OUT_OF_RANGE";
    case PlanError::kInvalidInterval:   return "INVALID_INTERVAL";
    case PlanError::kEmptyInput:        return "EMPTY_INPUT";
    case PlanError::kUnsortedInput:     return "UNSORTED_INPUT";
    case PlanError::kClipUnavailable:   return "CLIP_UNAVAILABLE";
    case PlanError::kCacheWrite:        return "CACHE_WRITE";
    case PlanError::kUnsupportedEffect: return "UNSUPPORTED_EFFECT";
    case PlanError::kCancelled:         return "CANCELLED";
    case PlanError::kConfigInvalid:     return "CONFIG_INVALID";
    case PlanError::kMalformedInput:    return "MALFORMED_INPUT";
    case PlanError::kRenderRejected:    return "RENDER_REJECTED";
  }
  return "UNKNOWN";
}

const char* DisplayModeName(DisplayMode mode) {
  switch (mode) {
    case DisplayMode::kFullFrame:        return "fullframe";
    case DisplayMode::kPictureInPicture: return "pip";
  }
  return "unknown";
}

std::optional<DisplayMode> DisplayModeFromName(const std::string& name) {
  if (name == "fullframe") return DisplayMode::kFullFrame;
  if (name == "pip") return DisplayMode::kPictureInPicture;
  return std::nullopt;
}

const char* ShortClipPolicyName(ShortClipPolicy policy) {
  switch (policy) {
    case ShortClipPolicy::kLoop:   return "loop";
    case ShortClipPolicy::kFreeze: return "freeze";
    case ShortClipPolicy::kReject: return "reject";
  }
  return "unknown";
}

std::optional<ShortClipPolicy> ShortClipPolicyFromName(const std::string& name) {
  if (name == "loop") return ShortClipPolicy::kLoop;
  if (name == "freeze") return ShortClipPolicy::kFreeze;
  if (name == "reject") return ShortClipPolicy::kReject;
  return std::nullopt;
}

std::string CaptionCue::Text() const {
  std::string text;
  for (const auto& word : words) {
    if (!text.empty()) text += ' ';
    text += word.text;
  }
  return text;
}

}  // namespace clipper::timeline
