#include "mfnam/core/UnitTable.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "mfnam/util/Parse.hpp"

namespace mfnam {

void UnitTable::insert(UnitTableEntry e) {
  if (e.unit <= 0) {
    throw std::invalid_argument("UnitTable: unit number must be positive, got " + std::to_string(e.unit));
  }
  if (contains(e.unit)) {
    const auto& prev = at(e.unit);
    throw std::invalid_argument("UnitTable: unit " + std::to_string(e.unit) + " already bound to '" +
                                prev.filename.string() + "' (" + prev.filetype + ")");
  }
  e.filetype = to_upper(e.filetype);
  pos_.emplace(e.unit, entries_.size());
  entries_.push_back(std::move(e));
}

const UnitTableEntry* UnitTable::find(int unit) const {
  auto it = pos_.find(unit);
  if (it == pos_.end()) return nullptr;
  return &entries_[it->second];
}

const UnitTableEntry& UnitTable::at(int unit) const {
  const auto* e = find(unit);
  if (!e) throw std::out_of_range("UnitTable: no entry for unit " + std::to_string(unit));
  return *e;
}

const UnitTableEntry* UnitTable::find_filetype(std::string_view filetype) const {
  for (const auto& e : entries_) {
    if (iequals(e.filetype, filetype)) return &e;
  }
  return nullptr;
}

std::vector<const UnitTableEntry*> UnitTable::find_all_filetype(std::string_view filetype) const {
  std::vector<const UnitTableEntry*> out;
  for (const auto& e : entries_) {
    if (iequals(e.filetype, filetype)) out.push_back(&e);
  }
  return out;
}

bool UnitTable::erase(int unit) {
  auto it = pos_.find(unit);
  if (it == pos_.end()) return false;
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
  reindex_();
  return true;
}

std::vector<int> UnitTable::units() const {
  std::vector<int> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.unit);
  return out;
}

std::vector<std::string> UnitTable::filetypes() const {
  std::vector<std::string> out;
  for (const auto& e : entries_) {
    if (std::find(out.begin(), out.end(), e.filetype) == out.end()) out.push_back(e.filetype);
  }
  return out;
}

void UnitTable::reindex_() {
  pos_.clear();
  for (std::size_t i = 0; i < entries_.size(); ++i) pos_.emplace(entries_[i].unit, i);
}

} // namespace mfnam
