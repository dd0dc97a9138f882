#include "mfnam/packages/TextPackage.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

#include "mfnam/core/Errors.hpp"
#include "mfnam/util/AtomicFile.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace mfnam {

namespace {

void push_unique(std::vector<int>& v, int unit) {
  if (unit > 0 && std::find(v.begin(), v.end(), unit) == v.end()) v.push_back(unit);
}

// OC in words form: "HEAD SAVE UNIT 51", "DRAWDOWN SAVE UNIT 52".
// OC in numeric form: item 1 is "IHEDFM IDDNFM IHEDUN IDDNUN".
void scan_oc(const std::vector<std::string>& lines, std::vector<int>& out) {
  bool first_data = true;
  for (const auto& line : lines) {
    if (is_comment_or_blank(line)) continue;
    const auto t = split_ws(line);
    if (first_data) {
      first_data = false;
      int probe = 0;
      if (!t.empty() && parse_int(t[0], probe)) {
        int ihedun = 0;
        int iddnun = 0;
        if (t.size() > 2 && parse_int(t[2], ihedun)) push_unique(out, ihedun);
        if (t.size() > 3 && parse_int(t[3], iddnun)) push_unique(out, iddnun);
        return;
      }
    }
    if (t.size() >= 4 && (iequals(t[0], "HEAD") || iequals(t[0], "DRAWDOWN")) &&
        iequals(t[1], "SAVE") && iequals(t[2], "UNIT")) {
      int unit = 0;
      if (parse_int(t[3], unit)) push_unique(out, unit);
    }
  }
}

// First data line that is not a PARAMETER declaration carries the budget unit.
void scan_budget_unit(const std::vector<std::string>& lines, int token, std::vector<int>& out) {
  for (const auto& line : lines) {
    if (is_comment_or_blank(line)) continue;
    const auto t = split_ws(line);
    if (!t.empty() && iequals(t[0], "PARAMETER")) continue;
    int unit = 0;
    if (static_cast<std::size_t>(token) < t.size() && parse_int(t[static_cast<std::size_t>(token)], unit)) {
      push_unique(out, unit);
    }
    return;
  }
}

} // namespace

TextPackage::TextPackage(PackageKind kind, std::string filetype, int unit, std::string filename,
                         std::vector<std::string> lines)
: Package(kind, filetype, {PackageFile{filetype, unit, std::move(filename)}}),
  lines_(std::move(lines)) {}

std::vector<int> TextPackage::scan_output_units(PackageKind kind, const std::vector<std::string>& lines) {
  std::vector<int> out;
  if (kind == PackageKind::Oc) {
    scan_oc(lines, out);
  } else if (budget_unit_token(kind) >= 0) {
    scan_budget_unit(lines, budget_unit_token(kind), out);
  }
  return out;
}

std::unique_ptr<Package> TextPackage::load_kind(PackageKind kind, const std::string& filetype,
                                                LoadContext& ctx, const UnitTableEntry& entry) {
  std::ifstream ifs(entry.filename);
  if (!ifs) throw PackageLoadError(filetype, entry.filename, "failed to open file");

  std::vector<std::string> lines;
  std::string line;
  bool has_data = false;
  while (std::getline(ifs, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!is_comment_or_blank(line)) has_data = true;
    lines.push_back(std::move(line));
  }
  if (!has_data) throw PackageLoadError(filetype, entry.filename, "file contains no data");

  auto pk = std::make_unique<TextPackage>(kind, filetype, entry.unit,
                                          relative_to(entry.filename, ctx.workspace()), std::move(lines));

  for (int unit : scan_output_units(kind, pk->lines_)) {
    if (unit == entry.unit) continue;
    ctx.claim_unit(unit);
    if (const auto* out = ctx.units().find(unit)) {
      pk->files_.push_back(PackageFile{out->filetype, unit, relative_to(out->filename, ctx.workspace())});
    }
  }
  return pk;
}

void TextPackage::write(const std::filesystem::path& workspace) const {
  util::atomic_write_text(workspace / filename(), [&](std::ostream& os) {
    for (const auto& l : lines_) os << l << "\n";
  });
}

std::string TextPackage::describe() const {
  std::string s = filetype_ + " package (" + std::to_string(lines_.size()) + " line(s)";
  if (files_.size() > 1) {
    s += ", output units";
    for (std::size_t i = 1; i < files_.size(); ++i) s += " " + std::to_string(files_[i].unit);
  }
  return s + ")";
}

} // namespace mfnam
