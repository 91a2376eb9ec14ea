// Repository: Clipper
// Component: Atomic File Writes Implementation
// Copyright (c) 2026 Clipper

#include "clipper/util/AtomicFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace clipper::util {

namespace {

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

}  // namespace

bool WriteFileAtomically(const std::string& path,
                         const std::string& contents,
                         std::string* error) {
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!of) {
      SetError(error, "cannot open " + tmp_path + ": " + std::strerror(errno));
      return false;
    }
    of << contents;
    of.flush();
    if (!of) {
      SetError(error, "write failed " + tmp_path);
      of.close();
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }
  return PublishFile(tmp_path, path, error);
}

bool PublishFile(const std::string& tmp_path,
                 const std::string& final_path,
                 std::string* error) {
  if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
    SetError(error, "rename " + tmp_path + " -> " + final_path + ": " +
                        std::strerror(errno));
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

bool EnsureDirectory(const std::string& path, std::string* error) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    SetError(error, "cannot create directory " + path + ": " + ec.message());
    return false;
  }
  if (!std::filesystem::is_directory(path, ec)) {
    SetError(error, path + " is not a directory");
    return false;
  }
  return true;
}

}  // namespace clipper::util
