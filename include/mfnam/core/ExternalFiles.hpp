#pragma once

#include <filesystem>

namespace mfnam {

// Data file referenced by unit number but not owned by any package.
struct ExternalFileEntry {
  int unit = 0;
  std::filesystem::path filename;
  bool binary = false;
};

// Hands out unit numbers for new external files. Units 1..1000 are left to
// packages and the name file; allocation starts at 1001 and only ever grows.
class ExternalUnitAllocator {
public:
  static constexpr int kFirstReserved = 1000;

  int allocate() { return ++last_; }

  // Skip past a unit already bound elsewhere (e.g. a DATA line in a loaded
  // name file) so allocate() never hands it out.
  void reserve_through(int unit) {
    if (unit > last_) last_ = unit;
  }

  int last() const { return last_; }

private:
  int last_ = kFirstReserved;
};

} // namespace mfnam
