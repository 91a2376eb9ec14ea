// Repository: Clipper
// Component: Engine Configuration
// Purpose: Typed engine settings loaded from a JSON file. Every value is
//          validated at load time so no job fails later on bad settings.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CONFIG_ENGINE_CONFIG_HPP_
#define CLIPPER_CONFIG_ENGINE_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clipper/captions/CaptionTimeline.hpp"
#include "clipper/timeline/TimelineTypes.hpp"
#include "clipper/timeline/TransitionGraphBuilder.hpp"

namespace clipper::config {

using timeline::PlanError;

// Output target handed to the renderer.
struct PlatformProfile {
  std::string name;
  int32_t width = 1080;
  int32_t height = 1920;
  int32_t fps = 30;
  std::string video_bitrate = "5000k";
  std::string audio_bitrate = "192k";
  int32_t max_duration_seconds = 60;
};

// tiktok, instagram_reels, youtube_shorts
const std::vector<PlatformProfile>& BuiltinPlatformProfiles();
std::optional<PlatformProfile> FindPlatformProfile(const std::string& name);

enum class FallbackMode {
  kSkip,         // Drop the cutaway; the avatar plays through
  kDefaultClip,  // Substitute broll.default_clip
};

const char* FallbackModeName(FallbackMode mode);

struct BrollConfig {
  timeline::ShortClipPolicy short_clip_policy = timeline::ShortClipPolicy::kLoop;
  FallbackMode fallback = FallbackMode::kSkip;
  std::string default_clip;
  bool strict = false;  // Any unavailable clip fails the job
  std::string library_dir = "assets/broll";
};

struct CacheConfig {
  std::string root = "data/temp/broll_cache";
  int32_t fetch_workers = 4;  // Concurrent clip downloads
};

struct BatchConfig {
  int32_t workers = 2;
  int64_t job_timeout_ms = 0;  // 0 = no timeout
};

struct RenderConfig {
  std::string endpoint;       // host:port of the render service; empty = none
  int64_t deadline_ms = 5000;
  std::string dump_dir;       // Write <job_id>.plan.json here; empty = off
};

struct ConfigResult;

struct EngineConfig {
  timeline::TransitionPolicy transitions;
  std::string transition_preset = "varied";  // Informational once styles resolve
  captions::CaptionOptions captions;
  BrollConfig broll;
  CacheConfig cache;
  BatchConfig batch;
  RenderConfig render;
  std::vector<PlatformProfile> platforms = BuiltinPlatformProfiles();

  // Parse from JSON. Missing sections and fields keep their defaults.
  static ConfigResult FromJson(const std::string& json_str);

  static ConfigResult LoadFile(const std::string& path);

  // Range checks shared by FromJson and programmatic construction.
  ConfigResult Validate() const;

  // Serialize (round-trips through FromJson).
  std::string ToJson() const;
};

struct ConfigResult {
  bool ok;
  PlanError error;
  std::string detail;
  EngineConfig config;

  static ConfigResult Success(EngineConfig c) {
    return {true, PlanError::kNone, "", std::move(c)};
  }

  static ConfigResult Failure(PlanError err, const std::string& detail = "") {
    return {false, err, detail, EngineConfig{}};
  }
};

}  // namespace clipper::config

#endif  // CLIPPER_CONFIG_ENGINE_CONFIG_HPP_
