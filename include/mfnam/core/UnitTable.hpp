#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mfnam {

struct UnitTableEntry {
  int unit = 0;
  std::filesystem::path filename;
  std::string filetype; // upper case, e.g. "DIS", "DATA(BINARY)"
  bool binary = false;
  std::string option;   // OLD | REPLACE | UNKNOWN, empty when absent
  std::size_t line = 0; // 1-based name file line, 0 when not parsed from a file
};

// Index of name file entries keyed by unit number.
//
// Lookups go through the unit index; iteration always follows insertion
// (manifest-encounter) order, which is the processing order of the loader.
class UnitTable {
public:
  using const_iterator = std::vector<UnitTableEntry>::const_iterator;

  // Throws std::invalid_argument if the unit is not positive or already present.
  void insert(UnitTableEntry e);

  bool contains(int unit) const { return pos_.find(unit) != pos_.end(); }
  const UnitTableEntry* find(int unit) const;
  const UnitTableEntry& at(int unit) const;

  // First entry (in encounter order) whose filetype matches, case-insensitive.
  const UnitTableEntry* find_filetype(std::string_view filetype) const;
  std::vector<const UnitTableEntry*> find_all_filetype(std::string_view filetype) const;

  bool erase(int unit);

  std::vector<int> units() const;
  // Distinct filetypes in encounter order.
  std::vector<std::string> filetypes() const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

private:
  std::vector<UnitTableEntry> entries_;
  std::unordered_map<int, std::size_t> pos_;

  void reindex_();
};

} // namespace mfnam
