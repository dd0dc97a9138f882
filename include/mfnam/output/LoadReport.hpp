#pragma once

#include <filesystem>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "mfnam/app/Loader.hpp"
#include "mfnam/util/AtomicFile.hpp"
#include "mfnam/util/Paths.hpp"

namespace mfnam::output {
namespace fs = std::filesystem;

// Bump when changing the JSON structure in non-backward-compatible ways.
inline constexpr const char* LOAD_REPORT_SCHEMA_VERSION = "1.0";

inline std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    switch (c) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (c < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c << std::dec;
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

inline void write_load_report_json(std::ostream& ofs, const LoadResult& res) {
  const Model& ml = res.model;
  const fs::path& ws = ml.model_ws();

  auto q = [&](const std::string& s) {
    return std::string("\"") + json_escape(s) + "\"";
  };
  auto write_paths = [&](const char* key, const std::vector<fs::path>& v) {
    ofs << "  \"" << key << "\": [";
    for (std::size_t i = 0; i < v.size(); ++i) {
      ofs << q(relative_to(v[i], ws));
      if (i + 1 < v.size()) ofs << ", ";
    }
    ofs << "]";
  };

  const GridShape s = ml.shape();
  ofs << "{\n";
  ofs << "  \"schema_version\": " << q(LOAD_REPORT_SCHEMA_VERSION) << ",\n";
  ofs << "  \"model\": {\n";
  ofs << "    \"name\": " << q(ml.name()) << ",\n";
  ofs << "    \"version\": " << q(ml.version()) << ",\n";
  ofs << "    \"exe_name\": " << q(ml.exe_name()) << ",\n";
  ofs << "    \"model_ws\": " << q(ws.generic_string()) << ",\n";
  ofs << "    \"namefile\": " << q(ml.namefile()) << ",\n";
  ofs << "    \"shape\": {\"nlay\": " << s.nlay << ", \"nrow\": " << s.nrow
      << ", \"ncol\": " << s.ncol << ", \"nper\": " << s.nper << "}\n";
  ofs << "  },\n";

  write_paths("loaded", res.loaded);
  ofs << ",\n";
  write_paths("not_loaded", res.not_loaded);
  ofs << ",\n";

  ofs << "  \"packages\": [\n";
  const auto& pks = ml.packages();
  for (std::size_t pi = 0; pi < pks.size(); ++pi) {
    const auto& pk = *pks[pi];
    ofs << "    {\n";
    ofs << "      \"filetype\": " << q(pk.filetype()) << ",\n";
    ofs << "      \"kind\": " << q(std::string(package_kind_tag(pk.kind()))) << ",\n";
    ofs << "      \"files\": [";
    for (std::size_t fi = 0; fi < pk.files().size(); ++fi) {
      const auto& f = pk.files()[fi];
      ofs << "{\"name\": " << q(f.name) << ", \"unit\": " << f.unit << ", \"filename\": " << q(f.filename) << "}";
      if (fi + 1 < pk.files().size()) ofs << ", ";
    }
    ofs << "]\n";
    ofs << "    }";
    if (pi + 1 < pks.size()) ofs << ",";
    ofs << "\n";
  }
  ofs << "  ],\n";

  ofs << "  \"external\": [\n";
  const auto& ext = ml.external_files();
  for (std::size_t i = 0; i < ext.size(); ++i) {
    ofs << "    {\"unit\": " << ext[i].unit << ", \"filename\": " << q(relative_to(ext[i].filename, ws))
        << ", \"binary\": " << (ext[i].binary ? "true" : "false") << "}";
    if (i + 1 < ext.size()) ofs << ",";
    ofs << "\n";
  }
  ofs << "  ],\n";

  ofs << "  \"unclaimed_units\": [";
  const auto units = res.unclaimed.units();
  for (std::size_t i = 0; i < units.size(); ++i) {
    ofs << units[i];
    if (i + 1 < units.size()) ofs << ", ";
  }
  ofs << "]\n";
  ofs << "}\n";
}

inline void write_load_report_json(const fs::path& out_path, const LoadResult& res) {
  util::atomic_write_text(out_path, [&](std::ostream& ofs) { write_load_report_json(ofs, res); });
}

} // namespace mfnam::output
