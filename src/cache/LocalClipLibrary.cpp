// Repository: Clipper
// Component: Local Clip Library Implementation
// Copyright (c) 2026 Clipper

#include "clipper/cache/LocalClipLibrary.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>

#include "clipper/cache/CacheKey.hpp"

namespace fs = std::filesystem;

namespace clipper::cache {

namespace {

constexpr std::array<const char*, 5> kVideoExtensions = {".mp4", ".mov", ".mkv", ".webm", ".m4v"};

bool IsVideoFile(const fs::path& p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find_if(kVideoExtensions.begin(), kVideoExtensions.end(),
                      [&](const char* e) { return ext == e; }) != kVideoExtensions.end();
}

std::vector<std::string> SplitWords(const std::string& normalized) {
  std::vector<std::string> words;
  std::istringstream in(normalized);
  std::string w;
  while (in >> w) words.push_back(w);
  return words;
}

}  // namespace

LocalClipLibrary::LocalClipLibrary(std::string directory)
    : directory_(std::move(directory)) {}

std::optional<std::string> LocalClipLibrary::FindMatch(const std::string& query) const {
  const auto words = SplitWords(NormalizeQuery(query));
  if (words.empty()) return std::nullopt;

  std::vector<fs::path> candidates;
  std::error_code ec;
  for (const auto& de : fs::directory_iterator(directory_, ec)) {
    std::error_code type_ec;
    if (de.is_regular_file(type_ec) && IsVideoFile(de.path())) {
      candidates.push_back(de.path());
    }
  }
  std::sort(candidates.begin(), candidates.end());

  for (const auto& path : candidates) {
    std::string stem = path.stem().string();
    std::replace(stem.begin(), stem.end(), '_', ' ');
    std::replace(stem.begin(), stem.end(), '-', ' ');
    const auto stem_words = SplitWords(NormalizeQuery(stem));
    const bool all_present = std::all_of(words.begin(), words.end(), [&](const std::string& w) {
      return std::find(stem_words.begin(), stem_words.end(), w) != stem_words.end();
    });
    if (all_present) return path.string();
  }
  return std::nullopt;
}

FetchOutcome LocalClipLibrary::Fetch(const FetchRequest& request) const {
  if (request.abort && request.abort->load()) {
    return FetchOutcome::Failure("aborted");
  }
  auto match = FindMatch(request.query);
  if (!match) {
    return FetchOutcome::Failure("no clip in " + directory_ + " matches the query");
  }
  std::error_code ec;
  fs::copy_file(*match, request.destination_path,
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return FetchOutcome::Failure("copy " + *match + " failed: " + ec.message());
  }
  return FetchOutcome::Success();
}

ClipFetchFn LocalClipLibrary::AsFetchFn() const {
  // Copy so the function outlives this object.
  LocalClipLibrary self = *this;
  return [self](const FetchRequest& request) { return self.Fetch(request); };
}

}  // namespace clipper::cache
