#include "mfnam/app/Loader.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "mfnam/core/Errors.hpp"
#include "mfnam/io/NameFile.hpp"
#include "mfnam/packages/ParameterPackages.hpp"
#include "mfnam/util/Parse.hpp"
#include "mfnam/util/Paths.hpp"

namespace fs = std::filesystem;

namespace mfnam {

namespace {

constexpr const char* kParameterTags[] = {"PVAL", "ZONE", "MULT"};

// "   WEL  package load...success"
std::string status_line(const std::string& filetype, const char* what, const char* status) {
  std::ostringstream oss;
  oss << "   " << std::left << std::setw(4) << filetype << ' ' << what << " load..." << status;
  return oss.str();
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

LoadOrchestrator::LoadOrchestrator(LoadRequest req) : req_(std::move(req)) {}

PackageLoadResult LoadOrchestrator::try_load(const PackageFactoryEntry& factory, LoadContext& ctx,
                                             const UnitTableEntry& entry) {
  PackageLoadResult r;
  r.filetype = entry.filetype;
  r.filename = entry.filename;
  r.unit = entry.unit;
  try {
    r.package = factory.load(ctx, entry);
    if (!r.package) r.error = "loader returned no package";
  } catch (const std::exception& ex) {
    r.package.reset();
    r.error = ex.what();
  } catch (...) {
    r.package.reset();
    r.error = "unknown exception";
  }
  return r;
}

LoadResult LoadOrchestrator::run() {
  loaded_.clear();
  not_loaded_.clear();

  // 1. Empty model bound to the workspace.
  const fs::path ws = normalize_dir(req_.model_ws);
  fs::path nam_path = resolve_path(ws, req_.name_file);
  if (!nam_path.has_extension() && !fs::exists(nam_path)) nam_path += ".nam";

  ModelOptions opt;
  opt.version = req_.version;
  opt.exe_name = req_.exe_name;
  opt.model_ws = ws;
  opt.verbose = req_.verbose;
  opt.log_stream = req_.log_stream;
  if (nam_path.has_extension()) opt.namefile_ext = nam_path.extension().string().substr(1);

  Model ml(nam_path.stem().string(), opt);
  for (const auto& f : req_.extra_factories) ml.registry().override_factory(f);
  const Log& log = ml.log();
  log.info("creating new model with name: " + ml.name());

  // 2. Name file. Parse failures propagate.
  UnitTable working = NameFileCodec::parse(nam_path, ws);
  ml.set_unit_table(working);
  if (log.verbose()) {
    log.info("name file entries:");
    for (const auto& e : working) {
      log.info("   " + std::to_string(e.unit) + " " + e.filetype + " " + e.filename.string());
    }
  }

  // 3. DIS before anything else.
  load_dis_(ml, working, nam_path);

  // 4. load_only
  const std::vector<std::string> load_only = resolve_load_only_(working);

  adopt_fixed_packages_(ml, working);

  // 5. Parameter substitution sources.
  resolve_parameters_(ml, working, load_only);

  // 6. Everything else, in name file order.
  load_remaining_(ml, working, load_only);

  // 7. Units packages claimed for themselves are not external files.
  reconcile_external_(ml, working);

  if (ml.has_package("BAS6")) ml.set_free_format(ml.bas_free_format());

  report_(ml);
  return LoadResult{std::move(ml), std::move(loaded_), std::move(not_loaded_), std::move(working)};
}

void LoadOrchestrator::load_dis_(Model& ml, UnitTable& working, const fs::path& nam_path) {
  const auto found = working.find_all_filetype("DIS");
  if (found.empty()) {
    throw MissingDiscretizationError("name file " + nam_path.string() +
                                     " has no DIS entry; the grid shape cannot be determined");
  }
  // First DIS in name file order wins; later ones are reported, not loaded.
  const UnitTableEntry dis = *found.front();
  std::vector<UnitTableEntry> extra;
  for (std::size_t i = 1; i < found.size(); ++i) extra.push_back(*found[i]);

  const PackageFactoryEntry* factory = ml.registry().resolve("DIS");
  if (!factory) throw MissingDiscretizationError("no loader registered for DIS");

  PackageLoadResult r;
  {
    LoadContext ctx = ml.load_context(working);
    r = try_load(*factory, ctx, dis);
  }
  if (!r.ok()) {
    throw MissingDiscretizationError("could not read discretization package: " +
                                     dis.filename.filename().string() + ". Stopping... " + r.error);
  }
  ml.log().info(status_line("DIS", "package", "success"));
  ml.add_package(std::move(r.package));
  if (!ml.dis()) ml.log().warn("DIS loader did not produce a discretization package; grid shape is unknown");
  loaded_.push_back(dis.filename);
  working.erase(dis.unit);

  for (const auto& e : extra) {
    ml.log().warn("ignoring DIS entry on name file line " + std::to_string(e.line) + " (" +
                  e.filename.filename().string() + "); the first DIS entry is used");
    not_loaded_.push_back(e.filename);
    working.erase(e.unit);
  }
}

std::vector<std::string> LoadOrchestrator::resolve_load_only_(const UnitTable& working) const {
  if (!req_.load_only) return working.filetypes();

  std::vector<std::string> out;
  std::vector<std::string> missing;
  for (const auto& raw : *req_.load_only) {
    const std::string ft = to_upper(raw);
    if (ft == "DIS") continue;
    if (!working.find_filetype(ft) && !contains(missing, ft)) missing.push_back(ft);
    if (!contains(out, ft)) out.push_back(ft);
  }
  if (!missing.empty()) throw InvalidLoadOnlyError(missing);
  return out;
}

void LoadOrchestrator::adopt_fixed_packages_(Model& ml, UnitTable& working) const {
  const fs::path& ws = ml.model_ws();
  if (const auto* e = working.find_filetype("LIST")) {
    const UnitTableEntry lst = *e;
    ml.list().set_file(0, PackageFile{"LIST", lst.unit, relative_to(lst.filename, ws)});
    working.erase(lst.unit);
  }
  if (ml.global()) {
    if (const auto* e = working.find_filetype("GLOBAL")) {
      const UnitTableEntry glo = *e;
      ml.global()->set_file(0, PackageFile{"GLOBAL", glo.unit, relative_to(glo.filename, ws)});
      working.erase(glo.unit);
    }
  }
}

void LoadOrchestrator::resolve_parameters_(Model& ml, UnitTable& working,
                                           const std::vector<std::string>& load_only) {
  const Log& log = ml.log();
  for (const char* tag : kParameterTags) {
    const PackageFactoryEntry* factory = ml.registry().resolve(tag);
    if (!factory) continue;

    std::vector<UnitTableEntry> entries;
    for (const auto* e : working.find_all_filetype(tag)) entries.push_back(*e);

    for (const auto& entry : entries) {
      const std::size_t claimed = ml.pop_keys().size();
      PackageLoadResult r;
      {
        LoadContext ctx = ml.load_context(working);
        r = try_load(*factory, ctx, entry);
      }
      working.erase(entry.unit);

      if (!r.ok()) {
        ml.rollback_pop_keys(claimed);
        log.info(status_line(entry.filetype, "package", "failed") + "\n   " + r.error);
        not_loaded_.push_back(entry.filename);
        continue;
      }

      // Parameters are resolved even when the package itself is not kept.
      if (const auto* pp = dynamic_cast<const ParameterPackage*>(r.package.get())) pp->apply(ml.params());

      if (contains(load_only, entry.filetype)) {
        log.info(status_line(entry.filetype, "package", "success"));
        loaded_.push_back(entry.filename);
        ml.add_package(std::move(r.package));
      } else {
        log.info(status_line(entry.filetype, "package", "skipped"));
        not_loaded_.push_back(entry.filename);
      }
    }
  }
}

void LoadOrchestrator::load_remaining_(Model& ml, UnitTable& working,
                                       const std::vector<std::string>& load_only) {
  const Log& log = ml.log();
  // Snapshot: successful loads erase from `working` while we walk it.
  const std::vector<UnitTableEntry> remaining(working.begin(), working.end());

  for (const auto& entry : remaining) {
    const PackageFactoryEntry* factory = ml.registry().resolve(entry.filetype);

    if (factory) {
      if (!contains(load_only, entry.filetype)) {
        log.info(status_line(entry.filetype, "package", "skipped"));
        not_loaded_.push_back(entry.filename);
        continue;
      }
      const std::size_t claimed = ml.pop_keys().size();
      PackageLoadResult r;
      {
        LoadContext ctx = ml.load_context(working);
        r = try_load(*factory, ctx, entry);
      }
      if (r.ok()) {
        log.info(status_line(entry.filetype, "package", "success"));
        loaded_.push_back(entry.filename);
        ml.add_package(std::move(r.package));
        working.erase(entry.unit);
      } else {
        ml.rollback_pop_keys(claimed);
        log.info(status_line(entry.filetype, "package", "failed") + "\n   " + r.error);
        not_loaded_.push_back(entry.filename);
      }
    } else if (icontains(entry.filetype, "DATA")) {
      log.info(status_line(entry.filetype, "file", "skipped") + "\n      " + entry.filename.filename().string());
      ml.unit_allocator().reserve_through(entry.unit);
      if (!ml.is_pop_key(entry.unit)) ml.add_external(entry.filename, entry.unit, entry.binary);
    } else {
      log.info(status_line(entry.filetype, "package", "skipped"));
      not_loaded_.push_back(entry.filename);
    }
  }
}

void LoadOrchestrator::reconcile_external_(Model& ml, UnitTable& working) const {
  for (int unit : ml.pop_keys()) {
    ml.remove_external(unit);
    if (!working.erase(unit)) {
      ml.log().info("warning: external file unit " + std::to_string(unit) + " does not exist in the name file table");
    }
  }
}

void LoadOrchestrator::report_(const Model& ml) const {
  const Log& log = ml.log();
  if (!log.verbose()) return;
  log.info("the following " + std::to_string(loaded_.size()) + " packages were successfully loaded.");
  for (const auto& f : loaded_) log.info("      " + f.filename().string());
  if (!not_loaded_.empty()) {
    log.info("the following " + std::to_string(not_loaded_.size()) + " packages were not loaded.");
    for (const auto& f : not_loaded_) log.info("      " + f.filename().string());
  }
  log.info(ml.describe());
}

LoadResult load_model(LoadRequest req) {
  return LoadOrchestrator(std::move(req)).run();
}

} // namespace mfnam
