// Repository: Clipper
// Component: Atomic File Writes
// Purpose: Publish a file so readers see either the old content or the
//          complete new content, never a partial write.
// Copyright (c) 2026 Clipper

#ifndef CLIPPER_UTIL_ATOMIC_FILE_HPP_
#define CLIPPER_UTIL_ATOMIC_FILE_HPP_

#include <string>

namespace clipper::util {

// Writes `contents` to "<path>.tmp.<pid>" then renames over `path`.
// On failure the temp file is removed, `path` is untouched and *error (if
// non-null) describes the failing step.
bool WriteFileAtomically(const std::string& path,
                         const std::string& contents,
                         std::string* error);

// Moves an already-written file into place. Same failure contract.
bool PublishFile(const std::string& tmp_path,
                 const std::string& final_path,
                 std::string* error);

// mkdir -p. Returns false and fills *error on failure.
bool EnsureDirectory(const std::string& path, std::string* error);

}  // namespace clipper::util

#endif  // CLIPPER_UTIL_ATOMIC_FILE_HPP_
