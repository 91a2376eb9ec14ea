// Repository: Clipper
// Component: Clip Source Seam
// Purpose: Function types through which the cache obtains clip bytes and
//          clip durations.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CACHE_CLIP_SOURCE_HPP_
#define CLIPPER_CACHE_CLIP_SOURCE_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace clipper::cache {

struct FetchRequest {
  std::string query;             // As written in the plan
  std::string normalized_query;  // NormalizeQuery(query)
  std::string destination_path;  // Write the clip here; the cache publishes it

  // Set when the cache is closing. Long fetches should poll it.
  const std::atomic<bool>* abort = nullptr;
};

struct FetchOutcome {
  bool ok;
  std::string detail;

  static FetchOutcome Success() { return {true, ""}; }
  static FetchOutcome Failure(const std::string& detail) { return {false, detail}; }
};

// Fetches one clip for a query into request.destination_path.
// Called at most once per key at a time.
using ClipFetchFn = std::function<FetchOutcome(const FetchRequest& request)>;

// Returns clip duration in milliseconds, or -1 if the file is unreadable.
using DurationProbeFn = std::function<int64_t(const std::string& path)>;

}  // namespace clipper::cache

#endif  // CLIPPER_CACHE_CLIP_SOURCE_HPP_
