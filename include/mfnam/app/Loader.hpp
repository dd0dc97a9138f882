#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "mfnam/core/UnitTable.hpp"
#include "mfnam/model/Model.hpp"
#include "mfnam/packages/Package.hpp"
#include "mfnam/packages/PackageRegistry.hpp"

namespace mfnam {

struct LoadRequest {
  // Name file; relative paths resolve against model_ws. Without an extension
  // ".nam" is appended.
  std::filesystem::path name_file;
  std::string version = "mf2005";
  std::string exe_name = "mf2005";
  bool verbose = false;
  std::filesystem::path model_ws = ".";

  // Filetype tags to load (case-insensitive). DIS is always loaded. Unset =
  // every tag in the name file.
  std::optional<std::vector<std::string>> load_only;

  std::ostream* log_stream = nullptr;

  // Registered on the new model's own registry (replacing built-ins with the
  // same tag) before anything is loaded.
  std::vector<PackageFactoryEntry> extra_factories;
};

// Outcome of one package loader call: either a package or the reason it
// failed. Loader exceptions stop here.
struct PackageLoadResult {
  std::string filetype;
  std::filesystem::path filename;
  int unit = 0;
  std::unique_ptr<Package> package;
  std::string error;

  bool ok() const { return package != nullptr; }
};

struct LoadResult {
  Model model;
  // Both lists are in load order: DIS, parameter packages, then name file order.
  std::vector<std::filesystem::path> loaded;
  std::vector<std::filesystem::path> not_loaded;
  // Name file entries no package claimed (skipped, failed or external data).
  UnitTable unclaimed;
};

// Loads a model from its name file.
//
// Order: parse name file -> DIS (fatal on failure) -> load_only check ->
// LIST/GLOBAL adoption -> PVAL, ZONE, MULT into the parameter context ->
// every other entry in name file order -> drop external entries for units
// packages claimed as their own.
//
// Fatal: FormatError / IoError (name file), MissingDiscretizationError,
// InvalidLoadOnlyError. Every other package failure is recorded in
// LoadResult::not_loaded and loading continues.
class LoadOrchestrator {
public:
  explicit LoadOrchestrator(LoadRequest req);

  LoadResult run();

  static PackageLoadResult try_load(const PackageFactoryEntry& factory, LoadContext& ctx,
                                    const UnitTableEntry& entry);

private:
  LoadRequest req_;
  std::vector<std::filesystem::path> loaded_;
  std::vector<std::filesystem::path> not_loaded_;

  void load_dis_(Model& ml, UnitTable& working, const std::filesystem::path& nam_path);
  std::vector<std::string> resolve_load_only_(const UnitTable& working) const;
  void adopt_fixed_packages_(Model& ml, UnitTable& working) const;
  void resolve_parameters_(Model& ml, UnitTable& working, const std::vector<std::string>& load_only);
  void load_remaining_(Model& ml, UnitTable& working, const std::vector<std::string>& load_only);
  void reconcile_external_(Model& ml, UnitTable& working) const;
  void report_(const Model& ml) const;
};

LoadResult load_model(LoadRequest req);

} // namespace mfnam
