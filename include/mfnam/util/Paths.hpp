#pragma once

#include <filesystem>
#include <string>

namespace mfnam {
namespace fs = std::filesystem;

inline fs::path resolve_path(const fs::path& base_dir, const fs::path& p) {
  if (p.is_absolute()) return p.lexically_normal();
  return (base_dir / p).lexically_normal();
}

// Absolute, normalised directory path without a trailing separator.
inline fs::path normalize_dir(const fs::path& dir) {
  fs::path p = fs::absolute(dir).lexically_normal();
  if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
  return p;
}

// Path as it should appear in a name file written into `base_dir`.
inline std::string relative_to(const fs::path& p, const fs::path& base_dir) {
  if (!p.is_absolute()) return p.lexically_normal().generic_string();
  const fs::path rel = p.lexically_normal().lexically_relative(base_dir.lexically_normal());
  if (rel.empty()) return p.generic_string();
  return rel.generic_string();
}

} // namespace mfnam
