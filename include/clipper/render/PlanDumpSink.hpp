// Repository: Clipper
// Component: Plan Dump Sink
// Purpose: Writes each CompositionPlan as JSON for inspection.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_RENDER_PLAN_DUMP_SINK_HPP_
#define CLIPPER_RENDER_PLAN_DUMP_SINK_HPP_

#include <string>

#include "clipper/render/IRenderSink.hpp"

namespace clipper::render {

// <dump_dir>/<job_id>.plan.json, plus <job_id>.srt with the captions.
// Both written atomically.
class PlanDumpSink : public IRenderSink {
 public:
  explicit PlanDumpSink(std::string dump_dir);

  RenderReceipt Submit(const RenderSubmission& submission) override;

  const char* Name() const override { return "plan-dump"; }

  std::string PlanPath(const std::string& job_id) const;
  std::string SrtPath(const std::string& job_id) const;

 private:
  std::string dump_dir_;
};

}  // namespace clipper::render

#endif  // CLIPPER_RENDER_PLAN_DUMP_SINK_HPP_
