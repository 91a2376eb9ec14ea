// Repository: Clipper
// Component: Recording Render Sink
// Purpose: Render sink for pipeline tests. Keeps a copy of every plan it
//          receives and accepts or rejects on demand.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_TESTS_FIXTURES_RECORDING_RENDER_SINK_HPP_
#define CLIPPER_TESTS_FIXTURES_RECORDING_RENDER_SINK_HPP_

#include <mutex>
#include <string>
#include <vector>

#include "clipper/render/IRenderSink.hpp"

namespace clipper::testing {

class RecordingRenderSink : public render::IRenderSink {
 public:
  struct Received {
    std::string job_id;
    std::string output_dir;
    std::vector<std::string> platforms;
    timeline::CompositionPlan plan;
  };

  void RejectWith(const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_detail_ = detail;
  }

  render::RenderReceipt Submit(const render::RenderSubmission& submission) override {
    std::lock_guard<std::mutex> lock(mutex_);
    Received r;
    r.job_id = submission.job_id;
    r.output_dir = submission.output_dir;
    for (const auto& p : submission.platforms) r.platforms.push_back(p.name);
    if (submission.plan != nullptr) r.plan = *submission.plan;
    received_.push_back(std::move(r));

    render::RenderReceipt receipt;
    if (!reject_detail_.empty()) {
      receipt.detail = reject_detail_;
      return receipt;
    }
    receipt.accepted = true;
    receipt.render_id = "render-" + submission.job_id;
    for (const auto& p : submission.platforms) {
      receipt.outputs.push_back({p.name, submission.output_dir + "/" + p.name + ".mp4"});
    }
    return receipt;
  }

  const char* Name() const override { return "recorder"; }

  std::vector<Received> received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  size_t Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::string reject_detail_;
  std::vector<Received> received_;
};

}  // namespace clipper::testing

#endif  // CLIPPER_TESTS_FIXTURES_RECORDING_RENDER_SINK_HPP_
