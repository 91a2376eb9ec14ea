// Repository: Clipper
// Component: Local Clip Library
// Purpose: Clip source backed by a directory of stock footage whose file
//          names describe their content.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CACHE_LOCAL_CLIP_LIBRARY_HPP_
#define CLIPPER_CACHE_LOCAL_CLIP_LIBRARY_HPP_

#include <optional>
#include <string>

#include "clipper/cache/ClipSource.hpp"

namespace clipper::cache {

// A file matches a query when its normalized stem ('_' and '-' read as
// spaces) contains every query word. Files are scanned in name order so the
// same query always picks the same file.
class LocalClipLibrary {
 public:
  explicit LocalClipLibrary(std::string directory);

  std::optional<std::string> FindMatch(const std::string& query) const;

  // Copies the matched file to request.destination_path.
  FetchOutcome Fetch(const FetchRequest& request) const;

  ClipFetchFn AsFetchFn() const;

  const std::string& directory() const { return directory_; }

 private:
  std::string directory_;
};

}  // namespace clipper::cache

#endif  // CLIPPER_CACHE_LOCAL_CLIP_LIBRARY_HPP_
