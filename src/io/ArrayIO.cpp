#include "mfnam/io/ArrayIO.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "mfnam/core/Errors.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace mfnam {

namespace {

std::string fmt_real(double v) {
  std::ostringstream oss;
  oss << std::setprecision(15) << v;
  return oss.str();
}

template <typename T>
std::string fmt_value(const T& v) {
  if constexpr (std::is_floating_point_v<T>) {
    return fmt_real(v);
  } else {
    return std::to_string(v);
  }
}

// Values are written 10 per line, each row of a 2D array starting a new line.
template <typename T>
void write_rows(std::ostream& os, const std::vector<T>& v, std::size_t row_len,
                const std::string& name, const char* one) {
  if (v.empty()) {
    os << "CONSTANT " << std::setw(15) << fmt_value(T{}) << "  " << name << "\n";
    return;
  }
  if (std::all_of(v.begin(), v.end(), [&](const T& x) { return x == v.front(); })) {
    os << "CONSTANT " << std::setw(15) << fmt_value(v.front()) << "  " << name << "\n";
    return;
  }
  os << "INTERNAL " << one << " (FREE) -1  " << name << "\n";
  if (row_len == 0) row_len = v.size();
  for (std::size_t start = 0; start < v.size(); start += row_len) {
    const std::size_t end = std::min(v.size(), start + row_len);
    for (std::size_t i = start; i < end; ++i) {
      os << ' ' << fmt_value(v[i]);
      if ((i - start + 1) % 10 == 0 || i + 1 == end) os << "\n";
    }
  }
}

} // namespace

// ---------------------------------------------------------------- LineReader

LineReader::LineReader(const std::filesystem::path& path, std::string filetype)
: ifs_(path), path_(path), filetype_(std::move(filetype)) {
  if (!ifs_) {
    throw PackageLoadError(filetype_, path_, "failed to open file");
  }
}

void LineReader::fail(const std::string& msg) const {
  throw PackageLoadError(filetype_, path_, "line " + std::to_string(line_no_) + ": " + msg);
}

bool LineReader::next_line(std::string& line) {
  pending_.clear();
  pending_pos_ = 0;
  repeat_left_ = 0;

  std::string raw;
  while (std::getline(ifs_, raw)) {
    ++line_no_;
    if (is_comment_or_blank(raw)) {
      const auto t = trim(raw);
      if (!seen_data_ && !t.empty()) heading_.emplace_back(t);
      continue;
    }
    seen_data_ = true;
    if (!raw.empty() && raw.back() == '\r') raw.pop_back();
    line = std::move(raw);
    return true;
  }
  return false;
}

std::string LineReader::require_line(const std::string& what) {
  std::string line;
  if (!next_line(line)) fail("unexpected end of file, expected " + what);
  return line;
}

std::string LineReader::next_value(const std::string& what) {
  if (repeat_left_ > 0) {
    --repeat_left_;
    return repeat_value_;
  }
  while (pending_pos_ >= pending_.size()) {
    std::string raw;
    if (!std::getline(ifs_, raw)) fail("unexpected end of file while reading " + what);
    ++line_no_;
    if (is_comment_or_blank(raw)) continue;
    seen_data_ = true;
    pending_.clear();
    pending_pos_ = 0;
    for (auto tok : split_ws(raw)) pending_.emplace_back(tok);
  }

  std::string tok = pending_[pending_pos_++];
  const auto star = tok.find('*');
  if (star != std::string::npos) {
    int count = 0;
    if (!parse_int(std::string_view(tok).substr(0, star), count) || count <= 0) {
      fail("invalid repeat count in '" + tok + "' while reading " + what);
    }
    repeat_value_ = tok.substr(star + 1);
    repeat_left_ = count - 1;
    return repeat_value_;
  }
  return tok;
}

double LineReader::next_double(const std::string& what) {
  const std::string tok = next_value(what);
  double v = 0.0;
  if (!parse_double(tok, v)) fail("invalid real value '" + tok + "' for " + what);
  return v;
}

int LineReader::next_int(const std::string& what) {
  const std::string tok = next_value(what);
  int v = 0;
  if (!parse_int(tok, v)) fail("invalid integer value '" + tok + "' for " + what);
  return v;
}

// --------------------------------------------------------------- ArrayReader

ArrayReader::ArrayReader(LineReader& in, LoadContext& ctx, std::string filetype, int own_unit)
: in_(in), ctx_(ctx), filetype_(std::move(filetype)), own_unit_(own_unit) {}

LineReader& ArrayReader::external_reader_(int unit, const std::string& name) {
  auto it = external_.find(unit);
  if (it != external_.end()) return *it->second;

  const UnitTableEntry* e = ctx_.units().find(unit);
  if (!e) in_.fail("EXTERNAL unit " + std::to_string(unit) + " for " + name + " is not in the name file");
  if (e->binary) in_.fail("binary EXTERNAL arrays are not supported (" + name + ", unit " + std::to_string(unit) + ")");

  ctx_.claim_unit(unit);
  auto reader = std::make_unique<LineReader>(e->filename, filetype_);
  LineReader& ref = *reader;
  external_.emplace(unit, std::move(reader));
  return ref;
}

ArrayReader::Control ArrayReader::read_control_(const std::string& name) {
  const std::string line = in_.require_line(name + " array control record");
  const auto toks = split_ws(line);
  if (toks.empty()) in_.fail("empty array control record for " + name);

  auto num = [&](std::size_t i, double def) {
    if (i >= toks.size()) return def;
    // Fixed-form records may run CNSTNT into FMTIN: "1.0(10G12.4)".
    std::string_view tok = toks[i];
    const auto paren = tok.find('(');
    if (paren != std::string_view::npos && paren > 0) tok = tok.substr(0, paren);
    double v = 0.0;
    if (!parse_double(tok, v)) {
      in_.fail("invalid constant '" + std::string(toks[i]) + "' in control record for " + name);
    }
    return v;
  };

  Control c;
  const std::string key = to_upper(toks[0]);
  if (key == "CONSTANT") {
    if (toks.size() < 2) in_.fail("CONSTANT without value for " + name);
    c.source = Source::Constant;
    c.cnstnt = num(1, 0.0);
  } else if (key == "INTERNAL") {
    c.source = Source::Internal;
    c.cnstnt = num(1, 1.0);
    c.reader = &in_;
  } else if (key == "OPEN/CLOSE") {
    if (toks.size() < 2) in_.fail("OPEN/CLOSE without file name for " + name);
    c.source = Source::External;
    c.owned = std::make_unique<LineReader>(resolve_path(ctx_.workspace(), std::string(toks[1])), filetype_);
    c.reader = c.owned.get();
    c.cnstnt = num(2, 1.0);
  } else if (key == "EXTERNAL") {
    int unit = 0;
    if (toks.size() < 2 || !parse_int(toks[1], unit)) in_.fail("EXTERNAL without unit number for " + name);
    c.source = Source::External;
    c.reader = &external_reader_(unit, name);
    c.cnstnt = num(2, 1.0);
  } else {
    int locat = 0;
    if (!parse_int(toks[0], locat)) in_.fail("unrecognised array control record for " + name + ": " + line);
    if (locat == 0) {
      c.source = Source::Constant;
      c.cnstnt = num(1, 0.0);
    } else if (locat < 0) {
      in_.fail("binary arrays (LOCAT < 0) are not supported for " + name);
    } else if (locat == own_unit_) {
      c.source = Source::Internal;
      c.cnstnt = num(1, 1.0);
      c.reader = &in_;
    } else {
      c.source = Source::External;
      c.reader = &external_reader_(locat, name);
      c.cnstnt = num(1, 1.0);
    }
  }

  // A zero multiplier on read arrays means "no scaling".
  if (c.source != Source::Constant && c.cnstnt == 0.0) c.cnstnt = 1.0;
  return c;
}

std::vector<double> ArrayReader::read_values_(std::size_t n, const std::string& name, bool integer) {
  Control c = read_control_(name);
  std::vector<double> out(n, c.cnstnt);
  if (c.source == Source::Constant) {
    if (integer && std::floor(c.cnstnt) != c.cnstnt) in_.fail("non-integer constant for " + name);
    return out;
  }
  for (std::size_t i = 0; i < n; ++i) {
    const double v = integer ? static_cast<double>(c.reader->next_int(name)) : c.reader->next_double(name);
    out[i] = v * c.cnstnt;
  }
  return out;
}

std::vector<double> ArrayReader::read_real_1d(std::size_t n, const std::string& name) {
  return read_values_(n, name, false);
}

Array2D<double> ArrayReader::read_real_2d(int nrow, int ncol, const std::string& name) {
  Array2D<double> a(nrow, ncol);
  a.values = read_values_(a.size(), name, false);
  return a;
}

Array2D<int> ArrayReader::read_int_2d(int nrow, int ncol, const std::string& name) {
  Array2D<int> a(nrow, ncol);
  const auto vals = read_values_(a.size(), name, true);
  for (std::size_t i = 0; i < vals.size(); ++i) a.values[i] = static_cast<int>(std::lround(vals[i]));
  return a;
}

// ------------------------------------------------------------------- writers

void write_array(std::ostream& os, const std::vector<double>& values, const std::string& name) {
  write_rows(os, values, values.size(), name, "1.0");
}

void write_array(std::ostream& os, const Array2D<double>& a, const std::string& name) {
  write_rows(os, a.values, static_cast<std::size_t>(a.ncol), name, "1.0");
}

void write_array(std::ostream& os, const Array2D<int>& a, const std::string& name) {
  write_rows(os, a.values, static_cast<std::size_t>(a.ncol), name, "1");
}

} // namespace mfnam
