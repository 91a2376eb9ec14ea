// Repository: Clipper
// Component: Clip Cache
// Purpose: Resolves search queries to local clip files with at most one
//          fetch per key in flight, atomic publication and process-lifetime
//          memoization of failures.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CACHE_CLIP_CACHE_HPP_
#define CLIPPER_CACHE_CLIP_CACHE_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "clipper/cache/CacheIndex.hpp"
#include "clipper/cache/ClipSource.hpp"
#include "clipper/timeline/TimelineTypes.hpp"
#include "clipper/util/CancelToken.hpp"

namespace clipper::cache {

using timeline::PlanError;

struct CacheResult {
  bool ok;
  PlanError error;
  std::string detail;
  CacheEntry entry;
  bool cache_hit = false;

  static CacheResult Success(CacheEntry e, bool hit) {
    return {true, PlanError::kNone, "", std::move(e), hit};
  }

  static CacheResult Failure(PlanError err, const std::string& detail = "") {
    return {false, err, detail, {}, false};
  }
};

// Layout under root:
//   <root>/<key>.mp4           published clips (authoritative)
//   <root>/index.jsonl         advisory index
//   <root>/.tmp/<key>.<pid>.<n>.part   in-progress downloads
//
// Fetches run on a pool of at most Options::fetch_workers threads, started
// on demand and joined by Close(). Waiters poll their cancel token; a
// cancelled waiter returns kCancelled while the fetch continues for any other
// waiter and still populates the cache. Disk checks and probes run outside
// the cache mutex, so a hit never waits behind another key's I/O.
class ClipCache {
 public:
  static constexpr const char* kIndexFileName = "index.jsonl";
  static constexpr const char* kTempDirName = ".tmp";
  static constexpr const char* kClipExtension = ".mp4";
  static constexpr int kDefaultWaitPollMs = 20;
  static constexpr int kDefaultFetchWorkers = 4;

  struct Options {
    std::string root;
    ClipFetchFn fetch_fn;      // Used by Resolve()
    DurationProbeFn probe_fn;  // Required
    std::chrono::milliseconds wait_poll{kDefaultWaitPollMs};
    int fetch_workers = kDefaultFetchWorkers;  // Values below 1 mean 1
  };

  // Creates the directory layout and reconciles the index with the files on
  // disk. Throws std::runtime_error if the directories cannot be created.
  explicit ClipCache(Options options);
  ~ClipCache();

  ClipCache(const ClipCache&) = delete;
  ClipCache& operator=(const ClipCache&) = delete;

  // Hit -> entry immediately. Miss -> fetch with the configured fetch_fn.
  CacheResult Resolve(const std::string& query,
                      const util::CancelToken* cancel = nullptr);

  // Same as Resolve() with an explicit fetch function for a miss.
  CacheResult Fetch(const std::string& query,
                    const ClipFetchFn& fetch_fn,
                    const util::CancelToken* cancel = nullptr);

  std::optional<CacheEntry> Lookup(const std::string& query) const;

  // Signals running fetches to abort, fails queued ones with kCancelled,
  // joins the fetch workers and compacts the index. Idempotent; further
  // Resolve() calls fail with kCancelled.
  void Close();

  const std::string& Root() const { return options_.root; }
  std::string IndexPath() const;
  std::string ClipPath(const std::string& key) const;

  size_t EntryCount() const;
  int64_t FetchInvocations() const { return fetch_invocations_.load(); }
  size_t FetchWorkerCount() const;

  struct OpenStats {
    size_t loaded = 0;
    size_t dropped_missing = 0;
    size_t adopted_orphans = 0;
    size_t removed_partials = 0;
    size_t corrupt_lines = 0;
  };
  const OpenStats& open_stats() const { return open_stats_; }

 private:
  struct InFlight {
    bool done = false;
    CacheResult result = CacheResult::Failure(PlanError::kClipUnavailable);
  };

  struct PendingFetch {
    std::string key;
    std::string query;
    ClipFetchFn fetch_fn;
    std::shared_ptr<InFlight> flight;
  };

  void Open();
  bool EnsureWorkerLocked(std::string* error);
  void WorkerLoop();
  void RunFetch(const PendingFetch& job);
  CacheResult AwaitFlight(std::unique_lock<std::mutex>& lock,
                          const std::shared_ptr<InFlight>& flight,
                          const std::string& query,
                          const util::CancelToken* cancel);
  std::optional<CacheEntry> ProbeExisting(const std::string& key,
                                          const std::string& normalized_query) const;
  void AppendIndex(const CacheEntry& entry);
  void CompactIndex();
  std::string NextTempPath(const std::string& key);

  Options options_;
  std::string temp_dir_;
  OpenStats open_stats_;

  mutable std::mutex mutex_;
  std::condition_variable flight_cv_;
  std::condition_variable work_cv_;
  std::map<std::string, CacheEntry> entries_;                       // Guarded by mutex_
  std::unordered_map<std::string, std::shared_ptr<InFlight>> in_flight_;  // Guarded by mutex_
  std::unordered_map<std::string, CacheResult> failures_;           // Guarded by mutex_
  std::deque<PendingFetch> fetch_queue_;                            // Guarded by mutex_
  std::vector<std::thread> workers_;                                // Guarded by mutex_
  size_t idle_workers_ = 0;                                         // Guarded by mutex_
  bool index_dirty_ = false;                                        // Guarded by mutex_
  bool closed_ = false;                                             // Guarded by mutex_

  std::mutex index_mutex_;  // Serializes index file writes; never held with mutex_

  std::atomic<bool> abort_{false};
  std::atomic<int64_t> fetch_invocations_{0};
  std::atomic<uint64_t> temp_seq_{0};
};

}  // namespace clipper::cache

#endif  // CLIPPER_CACHE_CLIP_CACHE_HPP_
