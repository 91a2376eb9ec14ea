// Repository: Clipper
// Component: Clip Cache Implementation
// Copyright (c) 2026 Clipper

#include "clipper/cache/ClipCache.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include "clipper/cache/CacheKey.hpp"
#include "clipper/util/AtomicFile.hpp"
#include "clipper/util/Logger.hpp"

namespace fs = std::filesystem;

namespace clipper::cache {

namespace {

int64_t NowUnixMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool IsNonEmptyFile(const std::string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return false;
  auto size = fs::file_size(path, ec);
  return !ec && size > 0;
}

void RemoveQuietly(const std::string& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

}  // namespace

// =============================================================================
// Construction / Open
// =============================================================================

ClipCache::ClipCache(Options options) : options_(std::move(options)) {
  if (options_.root.empty()) {
    throw std::runtime_error("ClipCache: root directory not set");
  }
  if (!options_.probe_fn) {
    throw std::runtime_error("ClipCache: duration probe not set");
  }
  temp_dir_ = (fs::path(options_.root) / kTempDirName).string();
  Open();
}

ClipCache::~ClipCache() {
  Close();
}

std::string ClipCache::IndexPath() const {
  return (fs::path(options_.root) / kIndexFileName).string();
}

std::string ClipCache::ClipPath(const std::string& key) const {
  return (fs::path(options_.root) / (key + kClipExtension)).string();
}

void ClipCache::Open() {
  std::string err;
  if (!util::EnsureDirectory(options_.root, &err) ||
      !util::EnsureDirectory(temp_dir_, &err)) {
    throw std::runtime_error("ClipCache: " + err);
  }

  // Partial downloads from a crashed process are never resumed.
  std::error_code ec;
  for (const auto& de : fs::directory_iterator(temp_dir_, ec)) {
    std::error_code rm_ec;
    if (fs::remove(de.path(), rm_ec)) ++open_stats_.removed_partials;
  }

  std::map<std::string, CacheEntry> found;
  auto loaded = CacheIndex::Load(IndexPath(), &open_stats_.corrupt_lines);
  for (auto& entry : loaded) {
    const std::string path = ClipPath(entry.key);
    if (!IsNonEmptyFile(path)) {
      ++open_stats_.dropped_missing;
      continue;
    }
    entry.local_path = path;
    // Appended lines: the last one for a key wins.
    if (found.count(entry.key) == 0) ++open_stats_.loaded;
    found[entry.key] = std::move(entry);
  }

  // Clips published by a process that died before appending to the index.
  for (const auto& de : fs::directory_iterator(options_.root, ec)) {
    std::error_code type_ec;
    if (!de.is_regular_file(type_ec)) continue;
    const fs::path& p = de.path();
    if (p.extension() != kClipExtension) continue;
    const std::string key = p.stem().string();
    if (!IsCacheKey(key) || found.count(key) > 0) continue;

    auto adopted = ProbeExisting(key, "");
    if (!adopted) continue;
    found[key] = std::move(*adopted);
    ++open_stats_.adopted_orphans;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(found);
  }
  CompactIndex();

  std::ostringstream oss;
  oss << "[ClipCache] opened root=" << options_.root
      << " entries=" << EntryCount()
      << " dropped=" << open_stats_.dropped_missing
      << " adopted=" << open_stats_.adopted_orphans
      << " partials_removed=" << open_stats_.removed_partials
      << " corrupt_lines=" << open_stats_.corrupt_lines;
  util::Logger::Info(oss.str());
}

// =============================================================================
// Resolve / Fetch
// =============================================================================

CacheResult ClipCache::Resolve(const std::string& query,
                               const util::CancelToken* cancel) {
  return Fetch(query, options_.fetch_fn, cancel);
}

CacheResult ClipCache::Fetch(const std::string& query,
                             const ClipFetchFn& fetch_fn,
                             const util::CancelToken* cancel) {
  const std::string normalized = NormalizeQuery(query);
  if (normalized.empty()) {
    return CacheResult::Failure(PlanError::kClipUnavailable, "empty search query");
  }
  const std::string key = ComputeCacheKey(normalized);

  std::optional<CacheEntry> known;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return CacheResult::Failure(PlanError::kCancelled, "clip cache is closed");
    }
    if (cancel && cancel->IsCancelled()) {
      return CacheResult::Failure(PlanError::kCancelled,
                                  "query '" + query + "': cancelled before lookup");
    }
    auto it = entries_.find(key);
    if (it != entries_.end()) known = it->second;
  }

  std::optional<CacheEntry> adopted;
  bool vanished = false;
  if (known) {
    if (IsNonEmptyFile(known->local_path)) {
      if (!known->query.empty() && known->query != normalized) {
        util::Logger::Warn("[ClipCache] key collision: '" + normalized +
                           "' and '" + known->query + "' share key " + key);
      }
      return CacheResult::Success(*known, true);
    }
    util::Logger::Warn("[ClipCache] clip vanished from disk: " + known->local_path);
    vanished = true;
  } else if (IsNonEmptyFile(ClipPath(key))) {
    adopted = ProbeExisting(key, normalized);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (closed_) {
    return CacheResult::Failure(PlanError::kCancelled, "clip cache is closed");
  }
  if (vanished) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.fetched_at_ms == known->fetched_at_ms) {
      entries_.erase(it);
      index_dirty_ = true;
    }
  }
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    // Published by a fetch that finished while the lock was released.
    return CacheResult::Success(it->second, true);
  }
  if (adopted) {
    entries_[key] = *adopted;
    lock.unlock();
    AppendIndex(*adopted);
    return CacheResult::Success(*adopted, true);
  }

  auto failed = failures_.find(key);
  if (failed != failures_.end()) {
    return failed->second;
  }

  std::shared_ptr<InFlight> flight;
  auto running = in_flight_.find(key);
  if (running != in_flight_.end()) {
    flight = running->second;
    util::Logger::Debug("[ClipCache] joining in-flight fetch key=" + key);
  } else {
    if (!fetch_fn) {
      return CacheResult::Failure(PlanError::kClipUnavailable,
                                  "query '" + query + "': no clip source configured");
    }
    std::string err;
    if (!EnsureWorkerLocked(&err)) {
      return CacheResult::Failure(PlanError::kClipUnavailable,
                                  "query '" + query + "': no fetch worker: " + err);
    }
    flight = std::make_shared<InFlight>();
    in_flight_[key] = flight;
    fetch_queue_.push_back(PendingFetch{key, query, fetch_fn, flight});
    work_cv_.notify_one();
  }

  return AwaitFlight(lock, flight, query, cancel);
}

CacheResult ClipCache::AwaitFlight(std::unique_lock<std::mutex>& lock,
                                   const std::shared_ptr<InFlight>& flight,
                                   const std::string& query,
                                   const util::CancelToken* cancel) {
  while (!flight->done) {
    if (cancel && cancel->IsCancelled()) {
      // The fetch keeps running for other waiters and still fills the cache.
      return CacheResult::Failure(PlanError::kCancelled,
                                  "query '" + query + "': cancelled while waiting for fetch");
    }
    flight_cv_.wait_for(lock, options_.wait_poll);
  }
  CacheResult result = flight->result;
  result.cache_hit = false;
  return result;
}

// =============================================================================
// Fetch workers
// =============================================================================

// Starts a worker unless an idle one can take the next job or the pool is
// full (the job then queues behind the busy workers). Fails only when no
// worker exists and none can be started.
bool ClipCache::EnsureWorkerLocked(std::string* error) {
  if (idle_workers_ > fetch_queue_.size()) return true;
  const size_t max_workers = static_cast<size_t>(std::max(1, options_.fetch_workers));
  if (workers_.size() >= max_workers) return true;
  try {
    workers_.emplace_back(&ClipCache::WorkerLoop, this);
  } catch (const std::system_error& e) {
    if (!workers_.empty()) {
      util::Logger::Warn(std::string("[ClipCache] cannot start fetch worker, queueing: ") +
                         e.what());
      return true;
    }
    if (error) *error = e.what();
    return false;
  }
  return true;
}

void ClipCache::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    ++idle_workers_;
    work_cv_.wait(lock, [this] { return closed_ || !fetch_queue_.empty(); });
    --idle_workers_;
    if (closed_) break;

    PendingFetch job = std::move(fetch_queue_.front());
    fetch_queue_.pop_front();
    lock.unlock();
    RunFetch(job);
    lock.lock();
  }
}

void ClipCache::RunFetch(const PendingFetch& job) {
  const std::string& key = job.key;
  const std::string& query = job.query;
  const std::string tmp_path = NextTempPath(key);
  const std::string final_path = ClipPath(key);
  fetch_invocations_.fetch_add(1);

  FetchRequest request;
  request.query = query;
  request.normalized_query = NormalizeQuery(query);
  request.destination_path = tmp_path;
  request.abort = &abort_;

  util::Logger::Info("[ClipCache] fetching '" + request.normalized_query + "' key=" + key);

  FetchOutcome outcome = FetchOutcome::Failure("not attempted");
  try {
    outcome = job.fetch_fn(request);
  } catch (const std::exception& e) {
    outcome = FetchOutcome::Failure(std::string("clip source threw: ") + e.what());
  }

  CacheResult result = CacheResult::Failure(PlanError::kClipUnavailable);
  if (!outcome.ok) {
    result = CacheResult::Failure(PlanError::kClipUnavailable,
                                  "query '" + query + "': " + outcome.detail);
  } else if (!IsNonEmptyFile(tmp_path)) {
    result = CacheResult::Failure(PlanError::kClipUnavailable,
                                  "query '" + query + "': clip source wrote no data");
  } else {
    const int64_t duration_ms = options_.probe_fn(tmp_path);
    std::string err;
    if (duration_ms <= 0) {
      result = CacheResult::Failure(PlanError::kClipUnavailable,
                                    "query '" + query + "': fetched clip is unreadable");
    } else if (!util::PublishFile(tmp_path, final_path, &err)) {
      result = CacheResult::Failure(PlanError::kCacheWrite,
                                    "query '" + query + "': " + err);
    } else {
      CacheEntry entry;
      entry.key = key;
      entry.query = request.normalized_query;
      entry.local_path = final_path;
      entry.source_duration_ms = duration_ms;
      entry.fetched_at_ms = NowUnixMs();
      result = CacheResult::Success(std::move(entry), false);
    }
  }
  if (!result.ok) {
    RemoveQuietly(tmp_path);
    util::Logger::Warn("[ClipCache] " + std::string(timeline::PlanErrorToString(result.error)) +
                       " " + result.detail);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result.ok) {
      entries_[key] = result.entry;
    } else if (result.error == PlanError::kClipUnavailable) {
      // Write errors may clear up (disk space); source failures are remembered.
      failures_[key] = result;
    }
    job.flight->result = result;
    job.flight->done = true;
    in_flight_.erase(key);
  }
  flight_cv_.notify_all();

  if (result.ok) AppendIndex(result.entry);
}

std::optional<CacheEntry> ClipCache::ProbeExisting(const std::string& key,
                                                   const std::string& normalized_query) const {
  const std::string path = ClipPath(key);
  const int64_t duration_ms = options_.probe_fn(path);
  if (duration_ms <= 0) {
    util::Logger::Warn("[ClipCache] ignoring unreadable clip " + path);
    return std::nullopt;
  }
  CacheEntry entry;
  entry.key = key;
  entry.query = normalized_query;
  entry.local_path = path;
  entry.source_duration_ms = duration_ms;
  entry.fetched_at_ms = NowUnixMs();
  return entry;
}

// =============================================================================
// Index / lifecycle
// =============================================================================

void ClipCache::AppendIndex(const CacheEntry& entry) {
  std::string err;
  std::lock_guard<std::mutex> lock(index_mutex_);
  if (!CacheIndex::Append(IndexPath(), entry, &err)) {
    util::Logger::Warn("[ClipCache] index append failed (clips remain usable): " + err);
  }
}

void ClipCache::CompactIndex() {
  std::vector<CacheEntry> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(entries_.size());
    for (const auto& kv : entries_) snapshot.push_back(kv.second);
    index_dirty_ = false;
  }
  std::string err;
  std::lock_guard<std::mutex> lock(index_mutex_);
  if (!CacheIndex::Save(IndexPath(), snapshot, &err)) {
    util::Logger::Warn("[ClipCache] index rewrite failed (clips remain usable): " + err);
  }
}

std::string ClipCache::NextTempPath(const std::string& key) {
  std::ostringstream name;
  name << key << "." << static_cast<unsigned long>(getpid()) << "."
       << temp_seq_.fetch_add(1) << ".part";
  return (fs::path(temp_dir_) / name.str()).string();
}

std::optional<CacheEntry> ClipCache::Lookup(const std::string& query) const {
  const std::string key = ComputeCacheKey(query);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

size_t ClipCache::EntryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t ClipCache::FetchWorkerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

void ClipCache::Close() {
  std::vector<std::thread> workers;
  bool compact = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    workers.swap(workers_);
    for (auto& pending : fetch_queue_) {
      pending.flight->result = CacheResult::Failure(
          PlanError::kCancelled,
          "query '" + pending.query + "': clip cache closed before fetch started");
      pending.flight->done = true;
      in_flight_.erase(pending.key);
    }
    fetch_queue_.clear();
    compact = index_dirty_ || !workers.empty();
  }
  abort_.store(true);
  work_cv_.notify_all();
  flight_cv_.notify_all();
  for (auto& t : workers) {
    if (t.joinable()) t.join();
  }
  if (compact) CompactIndex();
}

}  // namespace clipper::cache
