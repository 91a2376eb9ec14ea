// Repository: Clipper
// Component: Batch Runner Implementation
// Copyright (c) 2026 Clipper

#include "clipper/pipeline/BatchRunner.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>
#include <thread>

#include "clipper/util/Logger.hpp"

namespace clipper::pipeline {

using util::Logger;

BatchRunner::BatchRunner(const JobOrchestrator& orchestrator,
                         int32_t workers,
                         std::chrono::milliseconds job_timeout)
    : orchestrator_(orchestrator),
      workers_(std::max<int32_t>(workers, 1)),
      job_timeout_(job_timeout) {}

std::vector<JobReport> BatchRunner::RunAll(const std::vector<JobSpec>& jobs,
                                           const util::CancelToken* batch_cancel) const {
  std::vector<JobReport> reports(jobs.size());
  if (jobs.empty()) return reports;

  std::atomic<size_t> next{0};
  auto worker_loop = [&]() {
    while (true) {
      const size_t idx = next.fetch_add(1);
      if (idx >= jobs.size()) return;

      util::CancelToken token(batch_cancel);
      if (job_timeout_.count() > 0) token.SetTimeout(job_timeout_);

      JobReport report = orchestrator_.RunJob(jobs[idx], &token);
      if (!report.ok && report.error == PlanError::kCancelled && token.DeadlineExpired()) {
        std::ostringstream d;
        d << report.detail << " (timed out after " << job_timeout_.count() << "ms)";
        report.detail = d.str();
      }
      reports[idx] = std::move(report);
    }
  };

  const size_t n_threads = std::min(jobs.size(), static_cast<size_t>(workers_));
  Logger::Info("[BatchRunner] starting jobs=" + std::to_string(jobs.size()) +
               " workers=" + std::to_string(n_threads));

  std::vector<std::thread> threads;
  threads.reserve(n_threads);
  for (size_t i = 0; i < n_threads; ++i) {
    threads.emplace_back(worker_loop);
  }
  for (auto& t : threads) {
    t.join();
  }

  const Summary s = Summarize(reports);
  std::ostringstream oss;
  oss << "[BatchRunner] finished jobs=" << jobs.size()
      << " completed=" << s.completed << " degraded=" << s.degraded
      << " failed=" << s.failed << " cancelled=" << s.cancelled;
  Logger::Info(oss.str());
  return reports;
}

BatchRunner::Summary BatchRunner::Summarize(const std::vector<JobReport>& reports) {
  Summary s;
  for (const auto& r : reports) {
    if (r.ok) {
      ++s.completed;
      if (r.degraded()) ++s.degraded;
    } else {
      ++s.failed;
      if (r.error == PlanError::kCancelled) ++s.cancelled;
    }
  }
  return s;
}

}  // namespace clipper::pipeline
