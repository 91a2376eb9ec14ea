// Repository: Clipper
// Component: Transition Styles
// Purpose: Closed set of boundary effects and the named presets that expand
//          to style lists.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_TIMELINE_TRANSITION_STYLE_HPP_
#define CLIPPER_TIMELINE_TRANSITION_STYLE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clipper::timeline {

// =============================================================================
// Transition Style
// Names match the FFmpeg xfade transition names consumed by the renderer.
// kCut is never configured; it marks a boundary whose clamped duration is 0.
// =============================================================================

enum class TransitionStyle : int32_t {
  kCut = 0,
  kFade,
  kDissolve,
  kFadeBlack,
  kFadeWhite,
  kCircleOpen,
  kCircleClose,
  kZoomIn,
  kRadial,
  kSlideRight,
  kSlideLeft,
  kSlideUp,
  kSlideDown,
  kWipeLeft,
  kWipeRight,
  kWipeUp,
  kWipeDown,
};

const char* TransitionStyleName(TransitionStyle style);

// Configurable effects only; "cut" and unknown names return nullopt.
std::optional<TransitionStyle> TransitionStyleFromName(const std::string& name);

// smooth, dramatic, slide, wipe, varied
std::optional<std::vector<TransitionStyle>> TransitionPreset(const std::string& name);

// The "varied" preset: alternates dynamic and smooth effects.
std::vector<TransitionStyle> DefaultTransitionPattern();

}  // namespace clipper::timeline

#endif  // CLIPPER_TIMELINE_TRANSITION_STYLE_HPP_
