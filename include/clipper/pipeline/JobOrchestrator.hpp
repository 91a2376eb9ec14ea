// Repository: Clipper
// Component: Job Orchestrator
// Purpose: Runs one job end to end: validate, resolve clips, plan segments,
//          build transitions and captions, assemble the CompositionPlan and
//          hand it to the render sinks.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_PIPELINE_JOB_ORCHESTRATOR_HPP_
#define CLIPPER_PIPELINE_JOB_ORCHESTRATOR_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clipper/cache/ClipCache.hpp"
#include "clipper/config/EngineConfig.hpp"
#include "clipper/render/IRenderSink.hpp"
#include "clipper/timeline/TimelineTypes.hpp"
#include "clipper/util/CancelToken.hpp"

namespace clipper::pipeline {

using timeline::PlanError;

struct JobSpec {
  std::string job_id;
  std::string avatar_path;
  double total_duration_seconds = 0.0;  // <= 0: probe the avatar track
  std::vector<timeline::WordTiming> words;
  std::vector<timeline::BrollRequest> broll;
  std::string output_dir;
};

// One B-roll request whose clip could not be used.
struct CutawayFailure {
  int32_t request_index = -1;  // Row in JobSpec::broll
  std::string query;
  PlanError error = PlanError::kClipUnavailable;
  std::string detail;
  bool substituted = false;  // Default clip played instead
};

struct JobReport {
  std::string job_id;
  bool ok = false;
  PlanError error = PlanError::kNone;
  std::string detail;

  std::optional<timeline::CompositionPlan> plan;
  std::vector<CutawayFailure> failed_cutaways;
  int32_t skipped_cutaways = 0;
  int32_t substituted_cutaways = 0;
  std::vector<std::string> warnings;
  std::vector<render::PlatformOutput> outputs;
  int64_t elapsed_ms = 0;

  // Completed, but with at least one cutaway skipped or substituted.
  bool degraded() const { return ok && !failed_cutaways.empty(); }
};

// Stateless across jobs apart from the shared cache; RunJob may be called
// from several threads at once.
class JobOrchestrator {
 public:
  JobOrchestrator(config::EngineConfig config,
                  cache::ClipCache& cache,
                  cache::DurationProbeFn probe_fn,
                  std::vector<render::IRenderSink*> sinks = {});

  // All in-memory validation (planner, captions) happens before the first
  // clip is fetched. `cancel` detaches the job from cache waits and stops it
  // between steps.
  JobReport RunJob(const JobSpec& job, const util::CancelToken* cancel = nullptr) const;

  const config::EngineConfig& config() const { return config_; }

 private:
  struct ResolvedClip {
    std::string path;
    int64_t duration_ms = -1;
  };

  std::optional<ResolvedClip> DefaultClip() const;

  config::EngineConfig config_;
  cache::ClipCache& cache_;
  cache::DurationProbeFn probe_fn_;
  std::vector<render::IRenderSink*> sinks_;
};

}  // namespace clipper::pipeline

#endif  // CLIPPER_PIPELINE_JOB_ORCHESTRATOR_HPP_
