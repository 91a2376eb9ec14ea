// Repository: Clipper
// Component: Clip Cache Contract Tests
// Purpose: Single-flight fetching, cancellation, failure memoization and
//          on-disk reconciliation of ClipCache.
// Copyright (c) 2026 Clipper

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "clipper/cache/CacheKey.hpp"
#include "clipper/cache/ClipCache.hpp"
#include "FakeClipSource.hpp"
#include "TempDir.hpp"

namespace clipper::cache {
namespace {

namespace fs = std::filesystem;
using clipper::testing::FakeClipSource;
using clipper::testing::TempDir;

// =============================================================================
// Fixture
// =============================================================================

class ClipCacheContractTest : public ::testing::Test {
 protected:
  ClipCacheContractTest() : dir_("clip_cache") {}

  std::unique_ptr<ClipCache> OpenCache(int fetch_workers = ClipCache::kDefaultFetchWorkers,
                                       DurationProbeFn probe = clipper::testing::ProbeFakeClip) {
    ClipCache::Options options;
    options.root = dir_.Path("cache");
    options.fetch_fn = source_.AsFetchFn();
    options.probe_fn = std::move(probe);
    options.wait_poll = std::chrono::milliseconds(5);
    options.fetch_workers = fetch_workers;
    return std::make_unique<ClipCache>(std::move(options));
  }

  ~ClipCacheContractTest() override { source_.ReleaseFetches(); }

  TempDir dir_;
  FakeClipSource source_;
};

// =============================================================================
// Miss / hit
// =============================================================================

TEST_F(ClipCacheContractTest, MissFetchesAndPublishesThenHits) {
  source_.AddClip("team collab", 4000);
  auto cache = OpenCache();

  auto first = cache->Resolve("Team  Collab");
  ASSERT_TRUE(first.ok) << first.detail;
  EXPECT_FALSE(first.cache_hit);
  EXPECT_EQ(first.entry.key, ComputeCacheKey("team collab"));
  EXPECT_EQ(first.entry.query, "team collab");
  EXPECT_EQ(first.entry.source_duration_ms, 4000);
  EXPECT_EQ(first.entry.local_path, cache->ClipPath(first.entry.key));
  EXPECT_TRUE(fs::is_regular_file(first.entry.local_path));

  auto second = cache->Resolve("team collab");
  ASSERT_TRUE(second.ok);
  EXPECT_TRUE(second.cache_hit);
  EXPECT_EQ(second.entry.local_path, first.entry.local_path);

  EXPECT_EQ(cache->FetchInvocations(), 1);
  EXPECT_EQ(source_.TotalCalls(), 1);
  EXPECT_EQ(cache->EntryCount(), 1u);
  ASSERT_TRUE(cache->Lookup("TEAM COLLAB").has_value());
}

TEST_F(ClipCacheContractTest, NoPartialFilesLeftAfterFetch) {
  source_.AddClip("ocean", 2000);
  auto cache = OpenCache();
  ASSERT_TRUE(cache->Resolve("ocean").ok);
  const fs::path tmp = fs::path(cache->Root()) / ClipCache::kTempDirName;
  EXPECT_TRUE(fs::is_empty(tmp));
}

TEST_F(ClipCacheContractTest, IndexListsPublishedClips) {
  source_.AddClip("a", 1000);
  source_.AddClip("b", 2000);
  auto cache = OpenCache();
  ASSERT_TRUE(cache->Resolve("a").ok);
  ASSERT_TRUE(cache->Resolve("b").ok);
  auto entries = CacheIndex::Load(cache->IndexPath());
  EXPECT_EQ(entries.size(), 2u);
}

TEST_F(ClipCacheContractTest, FileDroppedIntoRootIsAdoptedOnLookup) {
  auto cache = OpenCache();
  ASSERT_TRUE(clipper::testing::WriteFakeClip(
      cache->ClipPath(ComputeCacheKey("sunset")), 3000));
  auto result = cache->Resolve("Sunset");
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_TRUE(result.cache_hit);
  EXPECT_EQ(result.entry.source_duration_ms, 3000);
  EXPECT_EQ(source_.TotalCalls(), 0);
}

// =============================================================================
// Single flight
// =============================================================================

TEST_F(ClipCacheContractTest, ConcurrentResolvesShareOneFetch) {
  source_.AddClip("team collab", 4000);
  source_.HoldFetches();
  auto cache = OpenCache();

  constexpr int kWaiters = 8;
  std::vector<CacheResult> results(kWaiters, CacheResult::Failure(PlanError::kNone));
  std::vector<std::thread> threads;
  for (int i = 0; i < kWaiters; ++i) {
    threads.emplace_back([&, i] {
      results[i] = cache->Resolve(i % 2 == 0 ? "team collab" : "Team  Collab");
    });
  }
  ASSERT_TRUE(source_.WaitForCalls(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  source_.ReleaseFetches();
  for (auto& t : threads) t.join();

  for (const auto& r : results) {
    ASSERT_TRUE(r.ok) << r.detail;
    EXPECT_EQ(r.entry.local_path, results[0].entry.local_path);
  }
  EXPECT_EQ(source_.CallsFor("team collab"), 1);
  EXPECT_EQ(cache->FetchInvocations(), 1);
}

TEST_F(ClipCacheContractTest, DifferentKeysFetchIndependently) {
  source_.AddClip("a", 1000);
  source_.AddClip("b", 1000);
  auto cache = OpenCache();
  std::thread ta([&] { EXPECT_TRUE(cache->Resolve("a").ok); });
  std::thread tb([&] { EXPECT_TRUE(cache->Resolve("b").ok); });
  ta.join();
  tb.join();
  EXPECT_EQ(source_.CallsFor("a"), 1);
  EXPECT_EQ(source_.CallsFor("b"), 1);
}

// =============================================================================
// Fetch workers
// =============================================================================

TEST_F(ClipCacheContractTest, ManyDistinctMissesReuseBoundedWorkers) {
  constexpr int kQueries = 200;
  for (int i = 0; i < kQueries; ++i) source_.AddClip("clip " + std::to_string(i), 1000);
  auto cache = OpenCache(2);

  for (int i = 0; i < kQueries; ++i) {
    auto result = cache->Resolve("clip " + std::to_string(i));
    ASSERT_TRUE(result.ok) << result.detail;
  }
  EXPECT_GE(cache->FetchWorkerCount(), 1u);
  EXPECT_LE(cache->FetchWorkerCount(), 2u);
  EXPECT_EQ(source_.TotalCalls(), kQueries);
  EXPECT_EQ(cache->EntryCount(), static_cast<size_t>(kQueries));
}

TEST_F(ClipCacheContractTest, ExcessMissesQueueBehindBusyWorkers) {
  constexpr int kQueries = 5;
  for (int i = 0; i < kQueries; ++i) source_.AddClip("q" + std::to_string(i), 1000);
  source_.HoldFetches();
  auto cache = OpenCache(2);

  std::vector<CacheResult> results(kQueries, CacheResult::Failure(PlanError::kNone));
  std::vector<std::thread> threads;
  for (int i = 0; i < kQueries; ++i) {
    threads.emplace_back([&, i] { results[i] = cache->Resolve("q" + std::to_string(i)); });
  }
  EXPECT_TRUE(source_.WaitForCalls(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(source_.TotalCalls(), 2) << "only two workers may fetch at once";
  EXPECT_EQ(cache->FetchWorkerCount(), 2u);

  source_.ReleaseFetches();
  for (auto& t : threads) t.join();
  for (const auto& r : results) EXPECT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(source_.TotalCalls(), kQueries);
}

TEST_F(ClipCacheContractTest, CloseFailsFetchesThatNeverStarted) {
  source_.AddClip("first", 1000);
  source_.AddClip("second", 1000);
  source_.HoldFetches();
  auto cache = OpenCache(1);

  CacheResult first = CacheResult::Failure(PlanError::kNone);
  CacheResult second = CacheResult::Failure(PlanError::kNone);
  std::thread ta([&] { first = cache->Resolve("first"); });
  ASSERT_TRUE(source_.WaitForCalls(1));
  std::thread tb([&] { second = cache->Resolve("second"); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  cache->Close();
  ta.join();
  tb.join();

  EXPECT_EQ(second.error, PlanError::kCancelled);
  EXPECT_NE(second.detail.find("before fetch started"), std::string::npos) << second.detail;
  EXPECT_EQ(source_.CallsFor("second"), 0);
}

TEST_F(ClipCacheContractTest, HitDoesNotWaitBehindAnotherKeysProbe) {
  source_.AddClip("fast", 1000);
  const std::string slow_key = ComputeCacheKey("slow");

  std::mutex gate_mutex;
  std::condition_variable gate_cv;
  bool probe_entered = false;
  bool gate_open = false;
  auto probe = [&](const std::string& path) -> int64_t {
    if (path.find(slow_key) != std::string::npos) {
      std::unique_lock<std::mutex> lock(gate_mutex);
      probe_entered = true;
      gate_cv.notify_all();
      gate_cv.wait(lock, [&] { return gate_open; });
    }
    return clipper::testing::ProbeFakeClip(path);
  };
  auto cache = OpenCache(ClipCache::kDefaultFetchWorkers, probe);
  ASSERT_TRUE(cache->Resolve("fast").ok);

  ASSERT_TRUE(clipper::testing::WriteFakeClip(cache->ClipPath(slow_key), 2000));
  CacheResult slow = CacheResult::Failure(PlanError::kNone);
  std::thread adopting([&] { slow = cache->Resolve("slow"); });
  {
    std::unique_lock<std::mutex> lock(gate_mutex);
    EXPECT_TRUE(gate_cv.wait_for(lock, std::chrono::seconds(5), [&] { return probe_entered; }));
  }

  auto hit = std::async(std::launch::async, [&] { return cache->Resolve("fast"); });
  const bool answered = hit.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
  {
    std::lock_guard<std::mutex> lock(gate_mutex);
    gate_open = true;
  }
  gate_cv.notify_all();
  adopting.join();

  EXPECT_TRUE(answered) << "hit blocked while another key was being probed";
  auto fast = hit.get();
  EXPECT_TRUE(fast.ok);
  EXPECT_TRUE(fast.cache_hit);
  ASSERT_TRUE(slow.ok) << slow.detail;
  EXPECT_EQ(slow.entry.source_duration_ms, 2000);
}

TEST_F(ClipCacheContractTest, IndexIsAppendedThenCompactedOnClose) {
  source_.AddClip("river", 1000);
  auto cache = OpenCache();
  auto first = cache->Resolve("river");
  ASSERT_TRUE(first.ok);
  fs::remove(first.entry.local_path);
  ASSERT_TRUE(cache->Resolve("river").ok);
  EXPECT_EQ(source_.CallsFor("river"), 2);
  EXPECT_EQ(CacheIndex::Load(cache->IndexPath()).size(), 2u);

  cache->Close();
  auto compacted = CacheIndex::Load(cache->IndexPath());
  ASSERT_EQ(compacted.size(), 1u);
  EXPECT_EQ(compacted[0].key, ComputeCacheKey("river"));
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(ClipCacheContractTest, CancelledWaiterDetachesWhileFetchCompletes) {
  source_.AddClip("slow query", 5000);
  source_.HoldFetches();
  auto cache = OpenCache();

  util::CancelToken token;
  CacheResult waiter = CacheResult::Failure(PlanError::kNone);
  std::thread t([&] { waiter = cache->Resolve("slow query", &token); });
  ASSERT_TRUE(source_.WaitForCalls(1));
  token.Cancel();
  t.join();

  EXPECT_FALSE(waiter.ok);
  EXPECT_EQ(waiter.error, PlanError::kCancelled);

  source_.ReleaseFetches();
  auto later = cache->Resolve("slow query");
  ASSERT_TRUE(later.ok) << later.detail;
  EXPECT_EQ(source_.CallsFor("slow query"), 1) << "cancellation must not restart the fetch";
}

TEST_F(ClipCacheContractTest, PreCancelledTokenNeverFetches) {
  source_.AddClip("x", 1000);
  auto cache = OpenCache();
  util::CancelToken token;
  token.Cancel();
  auto result = cache->Resolve("x", &token);
  EXPECT_EQ(result.error, PlanError::kCancelled);
  EXPECT_EQ(source_.TotalCalls(), 0);
}

TEST_F(ClipCacheContractTest, ExpiredDeadlineCancelsWait) {
  source_.AddClip("x", 1000);
  source_.HoldFetches();
  auto cache = OpenCache();
  util::CancelToken token;
  token.SetTimeout(std::chrono::milliseconds(30));
  auto result = cache->Resolve("x", &token);
  EXPECT_EQ(result.error, PlanError::kCancelled);
  source_.ReleaseFetches();
}

TEST_F(ClipCacheContractTest, ClosedCacheRejectsResolve) {
  source_.AddClip("x", 1000);
  auto cache = OpenCache();
  cache->Close();
  cache->Close();
  EXPECT_EQ(cache->Resolve("x").error, PlanError::kCancelled);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(ClipCacheContractTest, SourceFailureIsMemoized) {
  auto cache = OpenCache();
  auto first = cache->Resolve("nothing matches this");
  EXPECT_FALSE(first.ok);
  EXPECT_EQ(first.error, PlanError::kClipUnavailable);

  auto second = cache->Resolve("Nothing Matches This");
  EXPECT_EQ(second.error, PlanError::kClipUnavailable);
  EXPECT_EQ(source_.TotalCalls(), 1);
}

TEST_F(ClipCacheContractTest, EmptyDownloadIsUnavailable) {
  source_.AddEmptyResult("hollow");
  auto cache = OpenCache();
  auto result = cache->Resolve("hollow");
  EXPECT_EQ(result.error, PlanError::kClipUnavailable);
  EXPECT_NE(result.detail.find("no data"), std::string::npos) << result.detail;
  EXPECT_FALSE(fs::exists(cache->ClipPath(ComputeCacheKey("hollow"))));
}

TEST_F(ClipCacheContractTest, UnreadableDownloadIsUnavailable) {
  source_.AddClip("corrupt", 0);
  auto cache = OpenCache();
  auto result = cache->Resolve("corrupt");
  EXPECT_EQ(result.error, PlanError::kClipUnavailable);
  EXPECT_EQ(cache->EntryCount(), 0u);
}

TEST_F(ClipCacheContractTest, ThrowingSourceIsUnavailable) {
  auto cache = OpenCache();
  auto result = cache->Fetch("boom", [](const FetchRequest&) -> FetchOutcome {
    throw std::runtime_error("network down");
  });
  EXPECT_EQ(result.error, PlanError::kClipUnavailable);
  EXPECT_NE(result.detail.find("network down"), std::string::npos);
}

TEST_F(ClipCacheContractTest, EmptyQueryIsUnavailable) {
  auto cache = OpenCache();
  EXPECT_EQ(cache->Resolve("   ").error, PlanError::kClipUnavailable);
  EXPECT_EQ(source_.TotalCalls(), 0);
}

TEST_F(ClipCacheContractTest, PublishFailureIsCacheWriteAndRetried) {
  source_.AddClip("blocked", 1000);
  auto cache = OpenCache();
  // A directory squatting on the final path makes the rename fail.
  fs::create_directories(cache->ClipPath(ComputeCacheKey("blocked")));

  auto first = cache->Resolve("blocked");
  EXPECT_EQ(first.error, PlanError::kCacheWrite);
  auto second = cache->Resolve("blocked");
  EXPECT_EQ(second.error, PlanError::kCacheWrite);
  EXPECT_EQ(source_.CallsFor("blocked"), 2) << "write failures are not memoized";
}

// =============================================================================
// Reconciliation at open
// =============================================================================

TEST_F(ClipCacheContractTest, ReopenReconcilesIndexWithDisk) {
  source_.AddClip("keep me", 1000);
  source_.AddClip("lose me", 1000);
  std::string lost_path;
  {
    auto cache = OpenCache();
    ASSERT_TRUE(cache->Resolve("keep me").ok);
    auto lost = cache->Resolve("lose me");
    ASSERT_TRUE(lost.ok);
    lost_path = lost.entry.local_path;
  }

  const fs::path root = dir_.Path("cache");
  fs::remove(lost_path);
  ASSERT_TRUE(clipper::testing::WriteFakeClip(
      (root / (ComputeCacheKey("orphan") + ClipCache::kClipExtension)).string(), 2500));
  {
    std::ofstream partial(root / ClipCache::kTempDirName / "abc.1.0.part");
    partial << "half";
  }
  {
    std::ofstream index(root / ClipCache::kIndexFileName, std::ios::app);
    index << "{\"key\":\"broken\n";
  }

  FakeClipSource fresh;
  ClipCache::Options options;
  options.root = root.string();
  options.fetch_fn = fresh.AsFetchFn();
  options.probe_fn = clipper::testing::ProbeFakeClip;
  ClipCache reopened(std::move(options));

  const auto& stats = reopened.open_stats();
  EXPECT_EQ(stats.loaded, 1u);
  EXPECT_EQ(stats.dropped_missing, 1u);
  EXPECT_EQ(stats.adopted_orphans, 1u);
  EXPECT_EQ(stats.removed_partials, 1u);
  EXPECT_EQ(stats.corrupt_lines, 1u);
  EXPECT_EQ(reopened.EntryCount(), 2u);
  EXPECT_TRUE(fs::is_empty(root / ClipCache::kTempDirName));

  auto kept = reopened.Resolve("keep me");
  ASSERT_TRUE(kept.ok);
  EXPECT_TRUE(kept.cache_hit);

  auto orphan = reopened.Resolve("orphan");
  ASSERT_TRUE(orphan.ok);
  EXPECT_TRUE(orphan.cache_hit);
  EXPECT_EQ(orphan.entry.source_duration_ms, 2500);
  EXPECT_EQ(fresh.TotalCalls(), 0);

  auto refetched = reopened.Resolve("lose me");
  ASSERT_FALSE(refetched.ok) << "fresh source has no clip for it";
  EXPECT_EQ(fresh.CallsFor("lose me"), 1);
}

TEST_F(ClipCacheContractTest, ConstructorRejectsMissingSettings) {
  ClipCache::Options no_root;
  no_root.probe_fn = clipper::testing::ProbeFakeClip;
  EXPECT_THROW(ClipCache{std::move(no_root)}, std::runtime_error);

  ClipCache::Options no_probe;
  no_probe.root = dir_.Path("other");
  EXPECT_THROW(ClipCache{std::move(no_probe)}, std::runtime_error);
}

}  // namespace
}  // namespace clipper::cache
