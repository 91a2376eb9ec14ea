// Repository: Clipper
// Component: Cache Key
// Purpose: Stable digest of a normalized search query, used as the clip's
//          on-disk name.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_CACHE_CACHE_KEY_HPP_
#define CLIPPER_CACHE_CACHE_KEY_HPP_

#include <string>

namespace clipper::cache {

// ASCII lowercase, whitespace runs collapsed to one space, trimmed.
// "  Team   Collab " -> "team collab"
std::string NormalizeQuery(const std::string& query);

// 16 lowercase hex chars: zlib crc32 then adler32 of the normalized query.
// Equal normalized queries always yield the same key, across processes.
std::string ComputeCacheKey(const std::string& query);

// True for strings shaped like ComputeCacheKey output.
bool IsCacheKey(const std::string& candidate);

}  // namespace clipper::cache

#endif  // CLIPPER_CACHE_CACHE_KEY_HPP_
