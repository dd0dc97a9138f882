#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "mfnam/core/Errors.hpp"

namespace mfnam::util {
namespace fs = std::filesystem;

inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Rename a fully written temp file over the target so readers never see a
// half-written name file or package file.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  // Some filesystems refuse to rename over an existing path.
  fs::remove(out_path, ec);
  ec.clear();
  fs::rename(tmp_path, out_path, ec);
  if (ec) {
    throw IoError("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

template <typename WriteFn>
inline void atomic_write_text(const fs::path& out_path, WriteFn&& fn) {
  // Package files may sit in a subdirectory of the workspace.
  if (out_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) throw IoError("failed to create directory " + out_path.parent_path().string() + ": " + ec.message());
  }
  const fs::path tmp = make_tmp_path(out_path);
  {
    std::ofstream ofs(tmp);
    if (!ofs) throw IoError("failed to open file for writing: " + tmp.string());
    fn(ofs);
    ofs.flush();
    if (!ofs) throw IoError("failed while writing file: " + tmp.string());
  }
  atomic_rename_over(tmp, out_path);
}

} // namespace mfnam::util
