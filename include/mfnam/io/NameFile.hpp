#pragma once

#include <filesystem>
#include <istream>
#include <ostream>

#include "mfnam/core/UnitTable.hpp"

namespace mfnam {

class Model;

// Name file reader/writer.
//
// Line grammar: FILETYPE UNIT FILENAME [OLD|REPLACE|UNKNOWN]
// Blank lines and lines starting with '#' are skipped. FILETYPE is
// case-insensitive and stored upper case; relative filenames resolve against
// the base directory (the name file's own directory by default).
class NameFileCodec {
public:
  // Throws FormatError (with line number) on a malformed line or a repeated
  // unit, IoError when the file cannot be opened.
  static UnitTable parse(const std::filesystem::path& path);
  static UnitTable parse(const std::filesystem::path& path, const std::filesystem::path& base_dir);
  static UnitTable parse(std::istream& is, const std::filesystem::path& source,
                         const std::filesystem::path& base_dir);

  // Heading, GLOBAL (mf2k only), LIST, one line per package file, then one
  // DATA / DATA(BINARY) line per external file. Filenames are written
  // relative to the model workspace. A unit already written is not repeated.
  static void write(const Model& model, const std::filesystem::path& path);
  static void write(const Model& model, std::ostream& os);
};

} // namespace mfnam
