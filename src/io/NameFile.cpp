#include "mfnam/io/NameFile.hpp"

#include <fstream>
#include <iomanip>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "mfnam/core/Errors.hpp"
#include "mfnam/model/Model.hpp"
#include "mfnam/util/AtomicFile.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace fs = std::filesystem;

namespace mfnam {

namespace {

bool is_known_option(const std::string& opt) {
  return opt == "OLD" || opt == "REPLACE" || opt == "UNKNOWN";
}

} // namespace

UnitTable NameFileCodec::parse(const fs::path& path) {
  return parse(path, path.parent_path());
}

UnitTable NameFileCodec::parse(const fs::path& path, const fs::path& base_dir) {
  std::ifstream ifs(path);
  if (!ifs) throw IoError("failed to open name file: " + path.string());
  return parse(ifs, path, base_dir);
}

UnitTable NameFileCodec::parse(std::istream& is, const fs::path& source, const fs::path& base_dir) {
  UnitTable table;
  std::string line;
  std::size_t lineno = 0;
  std::vector<std::string_view> toks;

  while (std::getline(is, line)) {
    ++lineno;
    if (is_comment_or_blank(line)) continue;

    split_ws(line, toks);
    if (toks.size() < 3) {
      throw FormatError(source, lineno, "expected FILETYPE UNIT FILENAME [OPTION], got: " + std::string(trim(line)));
    }
    if (toks.size() > 4) {
      throw FormatError(source, lineno, "too many fields: " + std::string(trim(line)));
    }

    int unit = 0;
    if (!parse_int(toks[1], unit)) {
      throw FormatError(source, lineno, "unit number '" + std::string(toks[1]) + "' is not an integer");
    }
    if (unit <= 0) {
      throw FormatError(source, lineno, "unit number must be positive, got " + std::to_string(unit));
    }
    if (const auto* prev = table.find(unit)) {
      throw FormatError(source, lineno, "unit " + std::to_string(unit) + " already assigned on line " +
                                            std::to_string(prev->line) + " (" + prev->filetype + ")");
    }

    UnitTableEntry e;
    e.unit = unit;
    e.filetype = to_upper(toks[0]);
    e.filename = resolve_path(base_dir, std::string(toks[2]));
    e.binary = e.filetype.find("BINARY") != std::string::npos;
    e.line = lineno;
    if (toks.size() == 4) {
      e.option = to_upper(toks[3]);
      if (!is_known_option(e.option)) {
        throw FormatError(source, lineno, "unknown file option '" + std::string(toks[3]) + "' (use OLD|REPLACE|UNKNOWN)");
      }
    }
    table.insert(std::move(e));
  }
  if (is.bad()) throw IoError("read error on name file: " + source.string());
  return table;
}

void NameFileCodec::write(const Model& model, std::ostream& os) {
  const fs::path& ws = model.model_ws();
  std::map<int, std::string> written; // unit -> filename

  auto emit = [&](const std::string& name, int unit, const std::string& fname) {
    if (unit == 0) return;
    auto it = written.find(unit);
    if (it != written.end()) {
      // Output units shared between packages (e.g. one budget file) are written once.
      if (it->second != fname) {
        model.log().warn("name file: unit " + std::to_string(unit) + " of '" + fname +
                         "' already used by '" + it->second + "', entry skipped");
      }
      return;
    }
    written.emplace(unit, fname);
    os << std::left << std::setw(12) << name << std::right << ' ' << std::setw(3) << unit << ' ' << fname << "\n";
  };

  os << model.heading() << "\n";
  if (const auto* glo = model.global()) {
    const auto& f = glo->files().front();
    emit(f.name, f.unit, f.filename);
  }
  {
    const auto& f = model.list().files().front();
    emit(f.name, f.unit, f.filename);
  }
  for (const auto& pk : model.packages()) {
    for (const auto& f : pk->files()) emit(f.name, f.unit, f.filename);
  }

  for (const auto& e : model.external_files()) {
    if (e.unit == 0) continue;
    const std::string fr = relative_to(e.filename, ws);
    if (written.find(e.unit) != written.end()) {
      model.log().warn("name file: external unit " + std::to_string(e.unit) + " ('" + fr + "') already written, skipped");
      continue;
    }
    written.emplace(e.unit, fr);
    if (e.binary) {
      os << "DATA(BINARY)  " << std::setw(3) << e.unit << "  " << fr << " REPLACE\n";
    } else {
      os << "DATA          " << std::setw(3) << e.unit << "  " << fr << "\n";
    }
  }
}

void NameFileCodec::write(const Model& model, const fs::path& path) {
  util::atomic_write_text(path, [&](std::ostream& os) { write(model, os); });
}

} // namespace mfnam
