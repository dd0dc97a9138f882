#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "mfnam/core/Grid.hpp"
#include "mfnam/packages/Package.hpp"

namespace mfnam {

// Line-oriented reader for MODFLOW text input.
//
// - '#' lines are skipped; the ones before the first data line are kept as the
//   file heading.
// - next_value() walks free-format values across lines and expands the
//   "r*v" repeat syntax.
// - Errors are raised as PackageLoadError carrying file and line.
class LineReader {
public:
  LineReader(const std::filesystem::path& path, std::string filetype);

  // Next data line. Discards any values left on the current line.
  bool next_line(std::string& line);
  std::string require_line(const std::string& what);

  std::string next_value(const std::string& what);
  double next_double(const std::string& what);
  int next_int(const std::string& what);

  const std::vector<std::string>& heading() const { return heading_; }
  const std::filesystem::path& path() const { return path_; }
  std::size_t line_no() const { return line_no_; }

  [[noreturn]] void fail(const std::string& msg) const;

private:
  std::ifstream ifs_;
  std::filesystem::path path_;
  std::string filetype_;
  std::size_t line_no_ = 0;
  bool seen_data_ = false;
  std::vector<std::string> heading_;

  std::vector<std::string> pending_;
  std::size_t pending_pos_ = 0;
  int repeat_left_ = 0;
  std::string repeat_value_;
};

// Reads U1DREL / U2DREL / U2DINT arrays from their control record:
//   CONSTANT c | INTERNAL cnstnt ... | OPEN/CLOSE file cnstnt ... |
//   EXTERNAL unit cnstnt ... | LOCAT CNSTNT ... (fixed form)
// EXTERNAL units are looked up in the working unit table and claimed as
// internal to the package being loaded.
class ArrayReader {
public:
  ArrayReader(LineReader& in, LoadContext& ctx, std::string filetype, int own_unit);

  std::vector<double> read_real_1d(std::size_t n, const std::string& name);
  Array2D<double> read_real_2d(int nrow, int ncol, const std::string& name);
  Array2D<int> read_int_2d(int nrow, int ncol, const std::string& name);

private:
  enum class Source { Constant, Internal, External };

  struct Control {
    Source source = Source::Constant;
    double cnstnt = 1.0;
    LineReader* reader = nullptr;
    std::unique_ptr<LineReader> owned; // OPEN/CLOSE files are read once and closed
  };

  LineReader& in_;
  LoadContext& ctx_;
  std::string filetype_;
  int own_unit_ = 0;
  std::map<int, std::unique_ptr<LineReader>> external_;

  Control read_control_(const std::string& name);
  LineReader& external_reader_(int unit, const std::string& name);
  std::vector<double> read_values_(std::size_t n, const std::string& name, bool integer);
};

void write_array(std::ostream& os, const std::vector<double>& values, const std::string& name);
void write_array(std::ostream& os, const Array2D<double>& a, const std::string& name);
void write_array(std::ostream& os, const Array2D<int>& a, const std::string& name);

} // namespace mfnam
