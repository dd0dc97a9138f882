#include "mfnam/packages/ParameterPackages.hpp"

#include <iomanip>
#include <string>

#include "mfnam/core/Errors.hpp"
#include "mfnam/io/ArrayIO.hpp"
#include "mfnam/util/AtomicFile.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace mfnam {

namespace {

int read_count(LineReader& in, const char* what) {
  const std::string line = in.require_line(what);
  const auto t = split_ws(line);
  int n = -1;
  if (t.empty() || !parse_int(t[0], n) || n < 0) in.fail(std::string("expected non-negative ") + what + ", got: " + line);
  return n;
}

std::string read_name(LineReader& in, const std::string& what) {
  const std::string line = in.require_line(what);
  const auto t = split_ws(line);
  if (t.empty()) in.fail("missing " + what);
  return std::string(t[0]);
}

void require_grid(const LoadContext& ctx, const std::string& filetype, const UnitTableEntry& entry) {
  if (ctx.grid().nrow <= 0 || ctx.grid().ncol <= 0) {
    throw PackageLoadError(filetype, entry.filename, "grid shape unknown (DIS must be loaded first)");
  }
}

void write_heading(std::ostream& os, const std::vector<std::string>& heading, const char* tag) {
  if (heading.empty()) {
    os << "# " << tag << " package generated by mfnam\n";
    return;
  }
  for (const auto& h : heading) os << h << "\n";
}

} // namespace

// ---------------------------------------------------------------------- PVAL

PvalPackage::PvalPackage(int unit, std::string filename)
: ParameterPackage(PackageKind::Pval, "PVAL", {PackageFile{"PVAL", unit, std::move(filename)}}) {}

std::unique_ptr<Package> PvalPackage::load(LoadContext& ctx, const UnitTableEntry& entry) {
  LineReader in(entry.filename, "PVAL");
  auto pk = std::make_unique<PvalPackage>(entry.unit, relative_to(entry.filename, ctx.workspace()));
  const int n = read_count(in, "NPVAL");
  pk->heading = in.heading();
  for (int i = 0; i < n; ++i) {
    const std::string line = in.require_line("PARNAM PARVAL");
    const auto t = split_ws(line);
    double v = 0.0;
    if (t.size() < 2 || !parse_double(t[1], v)) in.fail("expected PARNAM PARVAL, got: " + line);
    pk->values.emplace_back(std::string(t[0]), v);
  }
  return pk;
}

void PvalPackage::apply(ParameterContext& params) const {
  for (const auto& [name, v] : values) params.set_value(name, v);
}

void PvalPackage::write(const std::filesystem::path& workspace) const {
  util::atomic_write_text(workspace / filename(), [&](std::ostream& os) {
    write_heading(os, heading, "PVAL");
    os << std::setw(10) << values.size() << "\n";
    for (const auto& [name, v] : values) {
      os << std::left << std::setw(10) << name << std::right << ' ' << std::setprecision(15) << v << "\n";
    }
  });
}

// ---------------------------------------------------------------------- ZONE

ZonePackage::ZonePackage(int unit, std::string filename)
: ParameterPackage(PackageKind::Zone, "ZONE", {PackageFile{"ZONE", unit, std::move(filename)}}) {}

std::unique_ptr<Package> ZonePackage::load(LoadContext& ctx, const UnitTableEntry& entry) {
  require_grid(ctx, "ZONE", entry);
  LineReader in(entry.filename, "ZONE");
  auto pk = std::make_unique<ZonePackage>(entry.unit, relative_to(entry.filename, ctx.workspace()));
  const int n = read_count(in, "NZN");
  pk->heading = in.heading();
  ArrayReader arr(in, ctx, "ZONE", entry.unit);
  for (int i = 0; i < n; ++i) {
    const std::string name = read_name(in, "ZONNAM");
    pk->zones.emplace_back(name, arr.read_int_2d(ctx.grid().nrow, ctx.grid().ncol, "zone " + name));
  }
  return pk;
}

void ZonePackage::apply(ParameterContext& params) const {
  for (const auto& [name, a] : zones) params.set_zone(name, a);
}

void ZonePackage::write(const std::filesystem::path& workspace) const {
  util::atomic_write_text(workspace / filename(), [&](std::ostream& os) {
    write_heading(os, heading, "ZONE");
    os << std::setw(10) << zones.size() << "\n";
    for (const auto& [name, a] : zones) {
      os << name << "\n";
      write_array(os, a, name);
    }
  });
}

// ---------------------------------------------------------------------- MULT

MultPackage::MultPackage(int unit, std::string filename)
: ParameterPackage(PackageKind::Mult, "MULT", {PackageFile{"MULT", unit, std::move(filename)}}) {}

std::unique_ptr<Package> MultPackage::load(LoadContext& ctx, const UnitTableEntry& entry) {
  require_grid(ctx, "MULT", entry);
  LineReader in(entry.filename, "MULT");
  auto pk = std::make_unique<MultPackage>(entry.unit, relative_to(entry.filename, ctx.workspace()));
  const int n = read_count(in, "NML");
  pk->heading = in.heading();
  ArrayReader arr(in, ctx, "MULT", entry.unit);
  for (int i = 0; i < n; ++i) {
    const std::string line = in.require_line("MLTNAM");
    const auto t = split_ws(line);
    if (t.empty()) in.fail("missing MLTNAM");
    const std::string name(t[0]);
    if (t.size() > 1 && iequals(t[1], "FUNCTION")) {
      in.fail("FUNCTION multiplier '" + name + "' is not supported");
    }
    pk->mults.emplace_back(name, arr.read_real_2d(ctx.grid().nrow, ctx.grid().ncol, "multiplier " + name));
  }
  return pk;
}

void MultPackage::apply(ParameterContext& params) const {
  for (const auto& [name, a] : mults) params.set_mult(name, a);
}

void MultPackage::write(const std::filesystem::path& workspace) const {
  util::atomic_write_text(workspace / filename(), [&](std::ostream& os) {
    write_heading(os, heading, "MULT");
    os << std::setw(10) << mults.size() << "\n";
    for (const auto& [name, a] : mults) {
      os << name << "\n";
      write_array(os, a, name);
    }
  });
}

} // namespace mfnam
