// Repository: Clipper
// Component: Cache Key Implementation
// Copyright (c) 2026 Clipper

#include "clipper/cache/CacheKey.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

#include <zlib.h>

namespace clipper::cache {

std::string NormalizeQuery(const std::string& query) {
  std::string out;
  out.reserve(query.size());
  bool pending_space = false;
  for (char raw : query) {
    unsigned char c = static_cast<unsigned char>(raw);
    if (std::isspace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += static_cast<char>(std::tolower(c));
  }
  return out;
}

std::string ComputeCacheKey(const std::string& query) {
  const std::string normalized = NormalizeQuery(query);
  const auto* data = reinterpret_cast<const Bytef*>(normalized.data());
  const auto len = static_cast<uInt>(normalized.size());

  const auto crc = static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0), data, len));
  const auto adler = static_cast<uint32_t>(adler32(adler32(0L, Z_NULL, 0), data, len));

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%08x%08x", crc, adler);
  return std::string(buf, 16);
}

bool IsCacheKey(const std::string& candidate) {
  if (candidate.size() != 16) return false;
  for (char c : candidate) {
    if (!std::isxdigit(static_cast<unsigned char>(c)) ||
        std::isupper(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace clipper::cache
