// Repository: Clipper
// Component: Batch Runner Tests
// Copyright (c) 2026 Clipper

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "clipper/cache/ClipCache.hpp"
#include "clipper/pipeline/BatchRunner.hpp"
#include "clipper/pipeline/JobOrchestrator.hpp"
#include "FakeClipSource.hpp"
#include "RecordingRenderSink.hpp"
#include "TempDir.hpp"

namespace clipper::pipeline {
namespace {

using clipper::testing::FakeClipSource;
using clipper::testing::ProbeFakeClip;
using clipper::testing::RecordingRenderSink;
using clipper::testing::TempDir;

class BatchRunnerTest : public ::testing::Test {
 protected:
  BatchRunnerTest() : dir_("batch") {
    cache::ClipCache::Options options;
    options.root = dir_.Path("cache");
    options.fetch_fn = source_.AsFetchFn();
    options.probe_fn = ProbeFakeClip;
    options.wait_poll = std::chrono::milliseconds(5);
    cache_ = std::make_unique<cache::ClipCache>(std::move(options));
    config_.platforms = {*config::FindPlatformProfile("youtube_shorts")};
  }

  ~BatchRunnerTest() override { source_.ReleaseFetches(); }

  JobSpec Job(const std::string& id, const std::string& query) const {
    JobSpec job;
    job.job_id = id;
    job.avatar_path = dir_.Path(id + ".mp4");
    job.total_duration_seconds = 10.0;
    job.words = {{"hello", {0.0, 0.6}}, {"there", {0.6, 1.2}}};
    timeline::BrollRequest r;
    r.interval = {2.0, 5.0};
    r.query = query;
    job.broll = {r};
    job.output_dir = dir_.Path("out/" + id);
    return job;
  }

  TempDir dir_;
  FakeClipSource source_;
  RecordingRenderSink sink_;
  config::EngineConfig config_;
  std::unique_ptr<cache::ClipCache> cache_;
};

TEST_F(BatchRunnerTest, ReportsComeBackInJobOrder) {
  source_.AddClip("ocean", 4000);
  source_.AddClip("forest", 4000);
  JobOrchestrator orchestrator(config_, *cache_, ProbeFakeClip, {&sink_});
  BatchRunner runner(orchestrator, 3, std::chrono::milliseconds(0));

  std::vector<JobSpec> jobs;
  for (int i = 0; i < 8; ++i) {
    jobs.push_back(Job("job" + std::to_string(i), i % 2 == 0 ? "ocean" : "forest"));
  }
  auto reports = runner.RunAll(jobs);
  ASSERT_EQ(reports.size(), jobs.size());
  for (size_t i = 0; i < jobs.size(); ++i) {
    EXPECT_EQ(reports[i].job_id, jobs[i].job_id);
    EXPECT_TRUE(reports[i].ok) << reports[i].detail;
  }
  EXPECT_EQ(sink_.Count(), jobs.size());
}

TEST_F(BatchRunnerTest, JobsShareOneFetchPerQuery) {
  source_.AddClip("ocean", 4000);
  source_.HoldFetches();
  JobOrchestrator orchestrator(config_, *cache_, ProbeFakeClip, {&sink_});
  BatchRunner runner(orchestrator, 4, std::chrono::milliseconds(0));

  std::vector<JobSpec> jobs = {Job("a", "ocean"), Job("b", "Ocean"), Job("c", " ocean "),
                               Job("d", "OCEAN")};
  std::vector<JobReport> reports;
  std::thread batch([&] { reports = runner.RunAll(jobs); });
  EXPECT_TRUE(source_.WaitForCalls(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  source_.ReleaseFetches();
  batch.join();

  EXPECT_EQ(source_.CallsFor("ocean"), 1);
  EXPECT_EQ(cache_->FetchInvocations(), 1);
  for (const auto& r : reports) EXPECT_TRUE(r.ok) << r.detail;
}

TEST_F(BatchRunnerTest, TimeoutCancelsOnlyTheSlowJob) {
  source_.AddClip("ocean", 4000);
  source_.AddClip("volcano", 4000);
  JobOrchestrator orchestrator(config_, *cache_, ProbeFakeClip, {&sink_});

  // Warm the cache so the second job never waits.
  ASSERT_TRUE(cache_->Resolve("ocean").ok);
  source_.HoldFetches();

  BatchRunner runner(orchestrator, 2, std::chrono::milliseconds(100));
  auto reports = runner.RunAll({Job("slow", "volcano"), Job("fast", "ocean")});
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_FALSE(reports[0].ok);
  EXPECT_EQ(reports[0].error, timeline::PlanError::kCancelled);
  EXPECT_NE(reports[0].detail.find("timed out after 100ms"), std::string::npos)
      << reports[0].detail;
  EXPECT_TRUE(reports[1].ok) << reports[1].detail;
}

TEST_F(BatchRunnerTest, BatchCancelStopsEveryJob) {
  source_.AddClip("ocean", 4000);
  JobOrchestrator orchestrator(config_, *cache_, ProbeFakeClip, {&sink_});
  BatchRunner runner(orchestrator, 2, std::chrono::milliseconds(0));

  util::CancelToken batch_cancel;
  batch_cancel.Cancel();
  auto reports = runner.RunAll({Job("a", "ocean"), Job("b", "ocean"), Job("c", "ocean")},
                               &batch_cancel);
  for (const auto& r : reports) {
    EXPECT_EQ(r.error, timeline::PlanError::kCancelled);
    EXPECT_EQ(r.detail.find("timed out"), std::string::npos);
  }
  EXPECT_EQ(source_.TotalCalls(), 0);
  EXPECT_EQ(BatchRunner::Summarize(reports).cancelled, 3);
}

TEST_F(BatchRunnerTest, EmptyBatchReturnsNoReports) {
  JobOrchestrator orchestrator(config_, *cache_, ProbeFakeClip, {});
  BatchRunner runner(orchestrator, 0, std::chrono::milliseconds(0));
  EXPECT_TRUE(runner.RunAll({}).empty());
}

TEST(BatchRunnerSummaryTest, CountsOutcomes) {
  std::vector<JobReport> reports(5);
  reports[0].ok = true;
  reports[1].ok = true;
  reports[1].failed_cutaways.push_back({});
  reports[2].error = timeline::PlanError::kOverlap;
  reports[3].error = timeline::PlanError::kCancelled;
  reports[4].error = timeline::PlanError::kRenderRejected;

  auto s = BatchRunner::Summarize(reports);
  EXPECT_EQ(s.completed, 2);
  EXPECT_EQ(s.degraded, 1);
  EXPECT_EQ(s.failed, 3);
  EXPECT_EQ(s.cancelled, 1);
}

}  // namespace
}  // namespace clipper::pipeline
