// Repository: Clipper
// Component: Render Sink Interface
// Purpose: Receiver of finished CompositionPlans (remote renderer, JSON dump,
//          test recorder).
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_RENDER_I_RENDER_SINK_HPP_
#define CLIPPER_RENDER_I_RENDER_SINK_HPP_

#include <string>
#include <vector>

#include "clipper/config/EngineConfig.hpp"
#include "clipper/timeline/TimelineTypes.hpp"

namespace clipper::render {

struct RenderSubmission {
  std::string job_id;
  std::string output_dir;
  std::vector<config::PlatformProfile> platforms;
  const timeline::CompositionPlan* plan = nullptr;  // Valid for the call only
};

struct PlatformOutput {
  std::string platform;
  std::string path;
};

struct RenderReceipt {
  bool accepted = false;
  std::string render_id;
  std::vector<PlatformOutput> outputs;
  std::string detail;  // Reason when not accepted
};

class IRenderSink {
 public:
  virtual ~IRenderSink() = default;

  // Called once per successful job from the job's own thread. Must be
  // safe to call concurrently from batch workers.
  virtual RenderReceipt Submit(const RenderSubmission& submission) = 0;

  virtual const char* Name() const = 0;
};

}  // namespace clipper::render

#endif  // CLIPPER_RENDER_I_RENDER_SINK_HPP_
