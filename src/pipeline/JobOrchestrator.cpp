// Repository: Clipper
// Component: Job Orchestrator Implementation
// Copyright (c) 2026 Clipper

#include "clipper/pipeline/JobOrchestrator.hpp"

#include <chrono>
#include <sstream>

#include "clipper/captions/CaptionTimeline.hpp"
#include "clipper/timeline/SegmentPlanner.hpp"
#include "clipper/timeline/TransitionGraphBuilder.hpp"
#include "clipper/util/Logger.hpp"

namespace clipper::pipeline {

using util::Logger;

JobOrchestrator::JobOrchestrator(config::EngineConfig config,
                                 cache::ClipCache& cache,
                                 cache::DurationProbeFn probe_fn,
                                 std::vector<render::IRenderSink*> sinks)
    : config_(std::move(config)),
      cache_(cache),
      probe_fn_(std::move(probe_fn)),
      sinks_(std::move(sinks)) {}

std::optional<JobOrchestrator::ResolvedClip> JobOrchestrator::DefaultClip() const {
  if (config_.broll.fallback != config::FallbackMode::kDefaultClip ||
      config_.broll.default_clip.empty() || !probe_fn_) {
    return std::nullopt;
  }
  const int64_t duration_ms = probe_fn_(config_.broll.default_clip);
  if (duration_ms <= 0) {
    Logger::Warn("[JobOrchestrator] default clip unreadable: " + config_.broll.default_clip);
    return std::nullopt;
  }
  return ResolvedClip{config_.broll.default_clip, duration_ms};
}

JobReport JobOrchestrator::RunJob(const JobSpec& job,
                                  const util::CancelToken* cancel) const {
  const auto started = std::chrono::steady_clock::now();
  JobReport report;
  report.job_id = job.job_id;

  auto finish = [&]() -> JobReport {
    report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return report;
  };
  auto fail = [&](PlanError err, const std::string& detail) -> JobReport {
    report.ok = false;
    report.error = err;
    report.detail = detail;
    Logger::Error("[JobOrchestrator] job=" + job.job_id + " FAILED error=" +
                  timeline::PlanErrorToString(err) + " detail=" + detail);
    return finish();
  };
  auto cancelled = [&]() { return cancel != nullptr && cancel->IsCancelled(); };

  Logger::Info("[JobOrchestrator] job=" + job.job_id + " start avatar=" + job.avatar_path +
               " words=" + std::to_string(job.words.size()) +
               " broll=" + std::to_string(job.broll.size()));

  // ---------------------------------------------------------------------------
  // 1. Total duration
  // ---------------------------------------------------------------------------
  double total = job.total_duration_seconds;
  if (total <= 0.0) {
    const int64_t probed_ms = probe_fn_ ? probe_fn_(job.avatar_path) : -1;
    if (probed_ms <= 0) {
      return fail(PlanError::kInvalidInterval,
                  "cannot determine duration of avatar track '" + job.avatar_path + "'");
    }
    total = timeline::MsToSeconds(probed_ms);
  }

  // ---------------------------------------------------------------------------
  // 2. In-memory validation, before any fetch
  // ---------------------------------------------------------------------------
  auto validation = timeline::SegmentPlanner::Validate(total, job.broll);
  if (!validation.ok) return fail(validation.error, validation.detail);

  auto cue_result = captions::CaptionTimeline::Build(job.words, config_.captions);
  if (!cue_result.ok) return fail(cue_result.error, cue_result.detail);

  for (const auto& platform : config_.platforms) {
    if (total > platform.max_duration_seconds) {
      std::ostringstream w;
      w << "duration " << total << "s exceeds " << platform.name << " limit of "
        << platform.max_duration_seconds << "s";
      report.warnings.push_back(w.str());
      Logger::Warn("[JobOrchestrator] job=" + job.job_id + " " + w.str());
    }
  }

  // ---------------------------------------------------------------------------
  // 3. Resolve clips, applying the fallback policy per request
  // ---------------------------------------------------------------------------
  const auto policy = config_.broll.short_clip_policy;
  std::optional<ResolvedClip> default_clip;
  bool default_clip_probed = false;

  std::vector<timeline::BrollRequest> kept;
  std::vector<ResolvedClip> kept_clips;
  std::vector<int32_t> kept_rows;

  for (size_t i = 0; i < job.broll.size(); ++i) {
    if (cancelled()) return fail(PlanError::kCancelled, "cancelled while resolving clips");
    const auto& req = job.broll[i];
    const int64_t needed_ms =
        timeline::SecondsToMs(req.interval.end) - timeline::SecondsToMs(req.interval.start);

    auto resolved = cache_.Resolve(req.query, cancel);
    if (!resolved.ok) {
      if (resolved.error == PlanError::kCancelled || resolved.error == PlanError::kCacheWrite) {
        return fail(resolved.error, resolved.detail);
      }
    } else if (policy == timeline::ShortClipPolicy::kReject &&
               resolved.entry.source_duration_ms < needed_ms) {
      std::ostringstream d;
      d << "query '" << req.query << "': clip is " << resolved.entry.source_duration_ms
        << "ms, interval needs " << needed_ms << "ms";
      resolved = cache::CacheResult::Failure(PlanError::kClipUnavailable, d.str());
    }

    if (resolved.ok) {
      kept.push_back(req);
      kept_clips.push_back({resolved.entry.local_path, resolved.entry.source_duration_ms});
      kept_rows.push_back(static_cast<int32_t>(i));
      continue;
    }

    CutawayFailure failure;
    failure.request_index = static_cast<int32_t>(i);
    failure.query = req.query;
    failure.error = resolved.error;
    failure.detail = resolved.detail;

    if (!config_.broll.strict) {
      if (!default_clip_probed) {
        default_clip = DefaultClip();
        default_clip_probed = true;
      }
      const bool default_usable =
          default_clip && !(policy == timeline::ShortClipPolicy::kReject &&
                            default_clip->duration_ms < needed_ms);
      if (default_usable) {
        failure.substituted = true;
        ++report.substituted_cutaways;
        kept.push_back(req);
        kept_clips.push_back(*default_clip);
        kept_rows.push_back(static_cast<int32_t>(i));
        Logger::Warn("[JobOrchestrator] job=" + job.job_id + " substituting default clip: " +
                     failure.detail);
      } else {
        ++report.skipped_cutaways;
        Logger::Warn("[JobOrchestrator] job=" + job.job_id + " skipping cutaway: " +
                     failure.detail);
      }
    }
    report.failed_cutaways.push_back(std::move(failure));
  }

  if (config_.broll.strict && !report.failed_cutaways.empty()) {
    std::ostringstream d;
    d << report.failed_cutaways.size() << " of " << job.broll.size()
      << " clips unavailable (strict mode):";
    for (const auto& f : report.failed_cutaways) {
      d << " [" << f.request_index << "] " << f.detail << ";";
    }
    return fail(PlanError::kClipUnavailable, d.str());
  }

  // ---------------------------------------------------------------------------
  // 4. Segments, with sources attached
  // ---------------------------------------------------------------------------
  auto planned = timeline::SegmentPlanner::Plan(total, kept, job.avatar_path);
  if (!planned.ok) return fail(planned.error, planned.detail);

  for (auto& seg : planned.segments) {
    if (seg.kind != timeline::SegmentKind::kCutaway) continue;
    const size_t k = static_cast<size_t>(seg.request_index);
    const ResolvedClip& clip = kept_clips[k];
    if (!timeline::SegmentPlanner::ApplySource(seg, clip.path, clip.duration_ms, policy)) {
      return fail(PlanError::kClipUnavailable,
                  "clip for '" + seg.query + "' is shorter than its interval");
    }
    seg.request_index = kept_rows[k];
  }

  // ---------------------------------------------------------------------------
  // 5. Transitions
  // ---------------------------------------------------------------------------
  auto graph = timeline::TransitionGraphBuilder::Build(planned.segments, config_.transitions);
  if (!graph.ok) return fail(graph.error, graph.detail);

  for (const auto& w : captions::CaptionTimeline::CheckCueTiming(cue_result.cues)) {
    report.warnings.push_back(w);
    Logger::Warn("[JobOrchestrator] job=" + job.job_id + " caption timing: " + w);
  }

  // ---------------------------------------------------------------------------
  // 6. Assemble
  // ---------------------------------------------------------------------------
  timeline::CompositionPlan plan;
  plan.job_id = job.job_id;
  plan.avatar_path = job.avatar_path;
  plan.total_duration_ms = timeline::SecondsToMs(total);
  plan.segments = std::move(planned.segments);
  plan.transitions = std::move(graph.graph.video);
  plan.audio_crossfades = std::move(graph.graph.audio);
  plan.captions = std::move(cue_result.cues);
  report.plan = std::move(plan);

  // ---------------------------------------------------------------------------
  // 7. Hand off
  // ---------------------------------------------------------------------------
  if (cancelled()) return fail(PlanError::kCancelled, "cancelled before render handoff");

  render::RenderSubmission submission;
  submission.job_id = job.job_id;
  submission.output_dir = job.output_dir;
  submission.platforms = config_.platforms;
  submission.plan = &*report.plan;
  for (auto* sink : sinks_) {
    render::RenderReceipt receipt = sink->Submit(submission);
    if (!receipt.accepted) {
      return fail(PlanError::kRenderRejected,
                  std::string(sink->Name()) + ": " + receipt.detail);
    }
    for (auto& out : receipt.outputs) report.outputs.push_back(std::move(out));
  }

  report.ok = true;
  std::ostringstream oss;
  oss << "[JobOrchestrator] job=" << job.job_id << " done segments="
      << report.plan->segments.size() << " transitions=" << report.plan->transitions.size()
      << " cues=" << report.plan->captions.size()
      << " skipped=" << report.skipped_cutaways
      << " substituted=" << report.substituted_cutaways;
  Logger::Info(oss.str());
  return finish();
}

}  // namespace clipper::pipeline
