// Repository: Clipper
// Component: Batch Runner
// Purpose: Runs independent jobs on a bounded worker pool sharing one
//          orchestrator (and so one clip cache).
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_PIPELINE_BATCH_RUNNER_HPP_
#define CLIPPER_PIPELINE_BATCH_RUNNER_HPP_

#include <chrono>
#include <cstdint>
#include <vector>

#include "clipper/pipeline/JobOrchestrator.hpp"
#include "clipper/util/CancelToken.hpp"

namespace clipper::pipeline {

class BatchRunner {
 public:
  struct Summary {
    int32_t completed = 0;  // ok, including degraded
    int32_t degraded = 0;
    int32_t failed = 0;
    int32_t cancelled = 0;  // Subset of failed
  };

  // workers >= 1. job_timeout of 0 means no per-job deadline.
  BatchRunner(const JobOrchestrator& orchestrator,
              int32_t workers,
              std::chrono::milliseconds job_timeout);

  // Blocks until every job has a report. reports[i] belongs to jobs[i].
  // Cancelling `batch_cancel` cancels every running and pending job.
  std::vector<JobReport> RunAll(const std::vector<JobSpec>& jobs,
                                const util::CancelToken* batch_cancel = nullptr) const;

  static Summary Summarize(const std::vector<JobReport>& reports);

 private:
  const JobOrchestrator& orchestrator_;
  int32_t workers_;
  std::chrono::milliseconds job_timeout_;
};

}  // namespace clipper::pipeline

#endif  // CLIPPER_PIPELINE_BATCH_RUNNER_HPP_
