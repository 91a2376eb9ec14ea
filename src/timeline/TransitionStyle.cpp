// Repository: Clipper
// Component: Transition Styles Implementation
// Copyright (c) 2026 Clipper

#include "clipper/timeline/TransitionStyle.hpp"

#include <utility>

namespace clipper::timeline {

namespace {

struct NamedStyle {
  const char* name;
  TransitionStyle style;
};

constexpr NamedStyle kConfigurableStyles[] = {
    {"fade", TransitionStyle::kFade},
    {"dissolve", TransitionStyle::kDissolve},
    {"fadeblack", TransitionStyle::kFadeBlack},
    {"fadewhite", TransitionStyle::kFadeWhite},
    {"circleopen", TransitionStyle::kCircleOpen},
    {"circleclose", TransitionStyle::kCircleClose},
    {"zoomin", TransitionStyle::kZoomIn},
    {"radial", TransitionStyle::kRadial},
    {"slideright", TransitionStyle::kSlideRight},
    {"slideleft", TransitionStyle::kSlideLeft},
    {"slideup", TransitionStyle::kSlideUp},
    {"slidedown", TransitionStyle::kSlideDown},
    {"wipeleft", TransitionStyle::kWipeLeft},
    {"wiperight", TransitionStyle::kWipeRight},
    {"wipeup", TransitionStyle::kWipeUp},
    {"wipedown", TransitionStyle::kWipeDown},
};

}  // namespace

const char* TransitionStyleName(TransitionStyle style) {
  if (style == TransitionStyle::kCut) return "cut";
  for (const auto& entry : kConfigurableStyles) {
    if (entry.style == style) return entry.name;
  }
  return "unknown";
}

std::optional<TransitionStyle> TransitionStyleFromName(const std::string& name) {
  for (const auto& entry : kConfigurableStyles) {
    if (name == entry.name) return entry.style;
  }
  return std::nullopt;
}

std::optional<std::vector<TransitionStyle>> TransitionPreset(const std::string& name) {
  using S = TransitionStyle;
  if (name == "smooth") {
    return std::vector<S>{S::kFade, S::kDissolve, S::kFadeBlack, S::kFadeWhite};
  }
  if (name == "dramatic") {
    return std::vector<S>{S::kCircleOpen, S::kCircleClose, S::kZoomIn, S::kRadial};
  }
  if (name == "slide") {
    return std::vector<S>{S::kSlideRight, S::kSlideLeft, S::kSlideUp, S::kSlideDown};
  }
  if (name == "wipe") {
    return std::vector<S>{S::kWipeLeft, S::kWipeRight, S::kWipeUp, S::kWipeDown};
  }
  if (name == "varied") {
    return DefaultTransitionPattern();
  }
  return std::nullopt;
}

std::vector<TransitionStyle> DefaultTransitionPattern() {
  using S = TransitionStyle;
  // avatar->cutaway slides in, cutaway->avatar eases back.
  return {S::kSlideRight, S::kFade, S::kDissolve,
          S::kCircleOpen, S::kSlideRight, S::kZoomIn};
}

}  // namespace clipper::timeline
