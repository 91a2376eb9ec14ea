// Repository: Clipper
// Component: Engine Configuration Implementation
// Purpose: Parse and validate EngineConfig from JSON.
// Copyright (c) 2026 Clipper

#include "clipper/config/EngineConfig.hpp"

#include <sstream>

#include "clipper/io/CsvReader.hpp"
#include "clipper/util/JsonFields.hpp"
#include "clipper/util/Logger.hpp"

namespace clipper::config {

namespace json = util::json;

namespace {

ConfigResult Invalid(const std::string& field, const std::string& what) {
  return ConfigResult::Failure(PlanError::kConfigInvalid, field + ": " + what);
}

// Present but wrong type is an error; absent keeps the default.
bool ReadInt(const std::string& obj, const std::string& field, int64_t& out,
             std::string& type_error) {
  if (!json::HasField(obj, field)) return true;
  if (!json::ExtractInt(obj, field, out)) {
    type_error = field + ": expected an integer";
    return false;
  }
  return true;
}

bool ReadBool(const std::string& obj, const std::string& field, bool& out,
              std::string& type_error) {
  if (!json::HasField(obj, field)) return true;
  if (!json::ExtractBool(obj, field, out)) {
    type_error = field + ": expected true or false";
    return false;
  }
  return true;
}

bool ReadString(const std::string& obj, const std::string& field, std::string& out,
                std::string& type_error) {
  if (!json::HasField(obj, field)) return true;
  if (!json::ExtractString(obj, field, out)) {
    type_error = field + ": expected a string";
    return false;
  }
  return true;
}

ConfigResult ParseTransitions(const std::string& obj, EngineConfig& cfg) {
  std::string err;
  if (!ReadInt(obj, "duration_ms", cfg.transitions.duration_ms, err) ||
      !ReadBool(obj, "audio_crossfade", cfg.transitions.audio_crossfade, err)) {
    return Invalid("transitions", err);
  }

  std::string preset;
  if (!ReadString(obj, "preset", preset, err)) return Invalid("transitions", err);
  if (!preset.empty()) {
    auto styles = timeline::TransitionPreset(preset);
    if (!styles) {
      return ConfigResult::Failure(PlanError::kUnsupportedEffect,
                                   "transitions.preset: unknown preset '" + preset + "'");
    }
    cfg.transitions.styles = *styles;
    cfg.transition_preset = preset;
  }

  if (json::HasField(obj, "styles")) {
    std::vector<std::string> names;
    if (!json::ExtractStringArray(obj, "styles", names)) {
      return Invalid("transitions.styles", "expected an array of effect names");
    }
    std::vector<timeline::TransitionStyle> styles;
    for (const auto& name : names) {
      auto style = timeline::TransitionStyleFromName(name);
      if (!style) {
        return ConfigResult::Failure(PlanError::kUnsupportedEffect,
                                     "transitions.styles: unsupported effect '" + name + "'");
      }
      styles.push_back(*style);
    }
    if (!preset.empty()) {
      util::Logger::Warn("[EngineConfig] transitions.styles overrides preset '" + preset + "'");
    }
    cfg.transitions.styles = std::move(styles);
    cfg.transition_preset = "custom";
  }
  return ConfigResult::Success({});
}

ConfigResult ParseCaptions(const std::string& obj, EngineConfig& cfg) {
  std::string err;
  int64_t max_words = cfg.captions.max_words_per_cue;
  if (!ReadInt(obj, "max_words_per_cue", max_words, err) ||
      !ReadBool(obj, "word_highlight", cfg.captions.word_highlight, err) ||
      !ReadInt(obj, "merge_short_words_ms", cfg.captions.merge_short_words_ms, err) ||
      !ReadInt(obj, "min_cue_duration_ms", cfg.captions.min_cue_duration_ms, err)) {
    return Invalid("captions", err);
  }
  if (max_words < 1 || max_words > 64) {
    return Invalid("captions.max_words_per_cue", "must be in [1, 64]");
  }
  cfg.captions.max_words_per_cue = static_cast<int32_t>(max_words);
  return ConfigResult::Success({});
}

ConfigResult ParseBroll(const std::string& obj, EngineConfig& cfg) {
  std::string err;
  std::string policy;
  std::string fallback;
  if (!ReadString(obj, "short_clip_policy", policy, err) ||
      !ReadString(obj, "fallback", fallback, err) ||
      !ReadString(obj, "default_clip", cfg.broll.default_clip, err) ||
      !ReadBool(obj, "strict", cfg.broll.strict, err) ||
      !ReadString(obj, "library_dir", cfg.broll.library_dir, err)) {
    return Invalid("broll", err);
  }
  if (!policy.empty()) {
    auto parsed = timeline::ShortClipPolicyFromName(policy);
    if (!parsed) {
      return Invalid("broll.short_clip_policy", "expected loop, freeze or reject");
    }
    cfg.broll.short_clip_policy = *parsed;
  }
  if (!fallback.empty()) {
    if (fallback == "skip") {
      cfg.broll.fallback = FallbackMode::kSkip;
    } else if (fallback == "default_clip") {
      cfg.broll.fallback = FallbackMode::kDefaultClip;
    } else {
      return Invalid("broll.fallback", "expected skip or default_clip");
    }
  }
  return ConfigResult::Success({});
}

ConfigResult ParsePlatforms(const std::string& json_str, EngineConfig& cfg) {
  std::vector<std::string> names;
  if (!json::ExtractStringArray(json_str, "platforms", names)) {
    return Invalid("platforms", "expected an array of platform names");
  }
  std::vector<PlatformProfile> profiles;
  for (const auto& name : names) {
    auto profile = FindPlatformProfile(name);
    if (!profile) return Invalid("platforms", "unknown platform '" + name + "'");
    profiles.push_back(*profile);
  }
  cfg.platforms = std::move(profiles);
  return ConfigResult::Success({});
}

}  // namespace

const std::vector<PlatformProfile>& BuiltinPlatformProfiles() {
  static const std::vector<PlatformProfile> kProfiles = {
      {"tiktok", 1080, 1920, 30, "5000k", "192k", 60},
      {"instagram_reels", 1080, 1920, 30, "5000k", "192k", 90},
      {"youtube_shorts", 1080, 1920, 30, "5000k", "192k", 60},
  };
  return kProfiles;
}

std::optional<PlatformProfile> FindPlatformProfile(const std::string& name) {
  for (const auto& p : BuiltinPlatformProfiles()) {
    if (p.name == name) return p;
  }
  return std::nullopt;
}

const char* FallbackModeName(FallbackMode mode) {
  switch (mode) {
    case FallbackMode::kSkip:        return "skip";
    case FallbackMode::kDefaultClip: return "default_clip";
  }
  return "unknown";
}

ConfigResult EngineConfig::FromJson(const std::string& json_str) {
  if (io::Trim(json_str).empty() || io::Trim(json_str).front() != '{') {
    return ConfigResult::Failure(PlanError::kConfigInvalid, "config must be a JSON object");
  }

  EngineConfig cfg;
  std::string section;
  std::string err;

  if (json::ExtractObject(json_str, "transitions", section)) {
    auto r = ParseTransitions(section, cfg);
    if (!r.ok) return r;
  }
  if (json::ExtractObject(json_str, "captions", section)) {
    auto r = ParseCaptions(section, cfg);
    if (!r.ok) return r;
  }
  if (json::ExtractObject(json_str, "broll", section)) {
    auto r = ParseBroll(section, cfg);
    if (!r.ok) return r;
  }
  if (json::ExtractObject(json_str, "cache", section)) {
    int64_t fetch_workers = cfg.cache.fetch_workers;
    if (!ReadString(section, "root", cfg.cache.root, err) ||
        !ReadInt(section, "fetch_workers", fetch_workers, err)) {
      return Invalid("cache", err);
    }
    if (fetch_workers < 1 || fetch_workers > 64) {
      return Invalid("cache.fetch_workers", "must be in [1, 64]");
    }
    cfg.cache.fetch_workers = static_cast<int32_t>(fetch_workers);
  }
  if (json::ExtractObject(json_str, "batch", section)) {
    int64_t workers = cfg.batch.workers;
    if (!ReadInt(section, "workers", workers, err) ||
        !ReadInt(section, "job_timeout_ms", cfg.batch.job_timeout_ms, err)) {
      return Invalid("batch", err);
    }
    if (workers < 1 || workers > 256) return Invalid("batch.workers", "must be in [1, 256]");
    cfg.batch.workers = static_cast<int32_t>(workers);
  }
  if (json::ExtractObject(json_str, "render", section)) {
    if (!ReadString(section, "endpoint", cfg.render.endpoint, err) ||
        !ReadInt(section, "deadline_ms", cfg.render.deadline_ms, err) ||
        !ReadString(section, "dump_dir", cfg.render.dump_dir, err)) {
      return Invalid("render", err);
    }
  }
  if (json::HasField(json_str, "platforms")) {
    auto r = ParsePlatforms(json_str, cfg);
    if (!r.ok) return r;
  }

  return cfg.Validate();
}

ConfigResult EngineConfig::LoadFile(const std::string& path) {
  std::string text;
  std::string err;
  if (!io::ReadTextFile(path, text, &err)) {
    return ConfigResult::Failure(PlanError::kConfigInvalid, err);
  }
  auto result = FromJson(text);
  if (!result.ok) result.detail = path + ": " + result.detail;
  return result;
}

ConfigResult EngineConfig::Validate() const {
  if (transitions.styles.empty()) {
    return Invalid("transitions.styles", "must name at least one effect");
  }
  for (auto style : transitions.styles) {
    if (style == timeline::TransitionStyle::kCut) {
      return ConfigResult::Failure(PlanError::kUnsupportedEffect,
                                   "transitions.styles: 'cut' is not an effect");
    }
  }
  if (transitions.duration_ms < 0 || transitions.duration_ms > 10000) {
    return Invalid("transitions.duration_ms", "must be in [0, 10000]");
  }
  if (captions.max_words_per_cue < 1) {
    return Invalid("captions.max_words_per_cue", "must be >= 1");
  }
  if (captions.merge_short_words_ms < 0 || captions.min_cue_duration_ms < 0) {
    return Invalid("captions", "thresholds must be >= 0");
  }
  if (broll.fallback == FallbackMode::kDefaultClip && broll.default_clip.empty()) {
    return Invalid("broll.default_clip", "required when fallback is default_clip");
  }
  if (cache.root.empty()) {
    return Invalid("cache.root", "must not be empty");
  }
  if (cache.fetch_workers < 1) {
    return Invalid("cache.fetch_workers", "must be >= 1");
  }
  if (batch.workers < 1) {
    return Invalid("batch.workers", "must be >= 1");
  }
  if (batch.job_timeout_ms < 0) {
    return Invalid("batch.job_timeout_ms", "must be >= 0");
  }
  if (render.deadline_ms <= 0) {
    return Invalid("render.deadline_ms", "must be > 0");
  }
  if (platforms.empty()) {
    return Invalid("platforms", "at least one platform is required");
  }
  return ConfigResult::Success(*this);
}

std::string EngineConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{\"transitions\":{\"styles\":[";
  for (size_t i = 0; i < transitions.styles.size(); ++i) {
    if (i > 0) oss << ",";
    oss << "\"" << timeline::TransitionStyleName(transitions.styles[i]) << "\"";
  }
  oss << "],\"duration_ms\":" << transitions.duration_ms
      << ",\"audio_crossfade\":" << (transitions.audio_crossfade ? "true" : "false")
      << "},\"captions\":{\"max_words_per_cue\":" << captions.max_words_per_cue
      << ",\"word_highlight\":" << (captions.word_highlight ? "true" : "false")
      << ",\"merge_short_words_ms\":" << captions.merge_short_words_ms
      << ",\"min_cue_duration_ms\":" << captions.min_cue_duration_ms
      << "},\"broll\":{\"short_clip_policy\":\""
      << timeline::ShortClipPolicyName(broll.short_clip_policy)
      << "\",\"fallback\":\"" << FallbackModeName(broll.fallback)
      << "\",\"default_clip\":\"" << json::Escape(broll.default_clip)
      << "\",\"strict\":" << (broll.strict ? "true" : "false")
      << ",\"library_dir\":\"" << json::Escape(broll.library_dir)
      << "\"},\"cache\":{\"root\":\"" << json::Escape(cache.root)
      << "\",\"fetch_workers\":" << cache.fetch_workers
      << "},\"batch\":{\"workers\":" << batch.workers
      << ",\"job_timeout_ms\":" << batch.job_timeout_ms
      << "},\"render\":{\"endpoint\":\"" << json::Escape(render.endpoint)
      << "\",\"deadline_ms\":" << render.deadline_ms
      << ",\"dump_dir\":\"" << json::Escape(render.dump_dir)
      << "\"},\"platforms\":[";
  for (size_t i = 0; i < platforms.size(); ++i) {
    if (i > 0) oss << ",";
    oss << "\"" << platforms[i].name << "\"";
  }
  oss << "]}";
  return oss.str();
}

}  // namespace clipper::config
