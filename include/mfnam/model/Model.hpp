#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mfnam/core/ExternalFiles.hpp"
#include "mfnam/core/Grid.hpp"
#include "mfnam/core/UnitTable.hpp"
#include "mfnam/packages/Discretization.hpp"
#include "mfnam/packages/FixedPackages.hpp"
#include "mfnam/packages/Package.hpp"
#include "mfnam/packages/PackageRegistry.hpp"
#include "mfnam/packages/ParameterContext.hpp"
#include "mfnam/util/Log.hpp"

namespace mfnam {

struct ModelOptions {
  std::string version = "mf2005"; // mf2k | mf2005 | mfnwt | mfusg
  std::string exe_name = "mf2005";
  std::filesystem::path model_ws = ".";
  std::string namefile_ext = "nam";
  int list_unit = 2;

  // Directory (relative to model_ws) that receives external array files.
  // Created when missing; turns on external storage mode.
  std::optional<std::filesystem::path> external_path;

  bool verbose = false;

  // Package files written concurrently by write_input() when > 1 and the
  // library was built with OpenMP.
  int write_threads = 1;

  std::ostream* log_stream = nullptr; // default: std::cerr
};

// In-memory model: packages, the name file it came from, external data files
// and the parameter substitution context.
//
// The model owns every package. Grid shape is never stored here; it always
// comes from the DIS package (all zeros without one).
class Model {
public:
  explicit Model(std::string name = "modflowtest", ModelOptions opt = {});

  Model(Model&&) = default;
  Model& operator=(Model&&) = default;
  Model(const Model&) = delete;
  Model& operator=(const Model&) = delete;

  // --- identity ---
  const std::string& name() const { return name_; }
  // Also renames the GLOBAL/LIST files.
  void set_name(std::string name);
  std::string namefile() const { return name_ + "." + namefile_ext_; }
  const std::string& namefile_ext() const { return namefile_ext_; }
  void set_namefile_ext(std::string ext) { namefile_ext_ = std::move(ext); }

  const std::string& version() const { return version_; }
  const std::string& exe_name() const { return exe_name_; }
  const std::string& heading() const { return heading_; }
  void set_heading(std::string h) { heading_ = std::move(h); }

  const std::filesystem::path& model_ws() const { return model_ws_; }
  // Creates the directory when missing. Package filenames stay relative, so
  // the next write_input() goes to the new location.
  void change_model_ws(const std::filesystem::path& ws);

  // --- flags ---
  bool free_format() const { return free_format_; }
  void set_free_format(bool v) { free_format_ = v; }
  // FREE on the BAS6 options line; false without a BAS6 package.
  bool bas_free_format() const;
  bool external() const { return external_; }
  const std::optional<std::filesystem::path>& external_path() const { return external_path_; }
  bool verbose() const { return log_.verbose(); }
  void set_verbose(bool v) { log_.set_verbose(v); }
  int write_threads() const { return write_threads_; }
  void set_write_threads(int n) { write_threads_ = n > 0 ? n : 1; }

  const Log& log() const { return log_; }

  // --- registry ---
  PackageRegistry& registry() { return registry_; }
  const PackageRegistry& registry() const { return registry_; }

  // --- packages ---
  // Replaces (with a warning) a package with the same filetype.
  Package& add_package(std::unique_ptr<Package> pk);
  bool remove_package(std::string_view filetype);
  Package* get_package(std::string_view filetype);
  const Package* get_package(std::string_view filetype) const;
  bool has_package(std::string_view filetype) const { return get_package(filetype) != nullptr; }
  const std::vector<std::unique_ptr<Package>>& packages() const { return packages_; }
  std::vector<std::string> package_names() const;

  GlobalPackage* global() { return glo_.get(); }
  const GlobalPackage* global() const { return glo_.get(); }
  ListPackage& list() { return *lst_; }
  const ListPackage& list() const { return *lst_; }

  // --- grid shape (delegates to DIS) ---
  const Discretization* dis() const;
  GridShape shape() const;
  int nlay() const { return shape().nlay; }
  int nrow() const { return shape().nrow; }
  int ncol() const { return shape().ncol; }
  int nper() const { return shape().nper; }

  // --- name file table as read by the loader ---
  const UnitTable& unit_table() const { return unit_table_; }
  void set_unit_table(UnitTable t) { unit_table_ = std::move(t); }

  // --- external data files ---
  // Replaces (with a warning) an entry with the same filename or unit.
  void add_external(const std::filesystem::path& filename, int unit, bool binary = false);
  bool remove_external(int unit);
  bool remove_external(const std::filesystem::path& filename);
  const std::vector<ExternalFileEntry>& external_files() const { return externals_; }

  ExternalUnitAllocator& unit_allocator() { return allocator_; }
  int next_ext_unit() { return allocator_.allocate(); }

  // Units a loaded package turned out to use internally; the loader drops
  // their external entries after all packages are loaded.
  void add_pop_key(int unit);
  const std::vector<int>& pop_keys() const { return pop_keys_; }
  bool is_pop_key(int unit) const;
  // Forget units claimed after the first `n` (used when a loader fails half way).
  void rollback_pop_keys(std::size_t n) {
    if (n < pop_keys_.size()) pop_keys_.resize(n);
  }

  // Context handed to package loaders. `working` is the loader's table of
  // not yet claimed name file entries; the context must not outlive it.
  LoadContext load_context(const UnitTable& working);

  ParameterContext& params() { return params_; }
  const ParameterContext& params() const { return params_; }

  // --- output ---
  // Name file into model_ws(). Throws IoError.
  void write_name_file() const;
  // Every package file, then the name file. Throws the first package error
  // (in package order).
  void write_input() const;

  // "MODFLOW 3 layer(s), 10 row(s), 20 column(s), 2 stress period(s)"
  std::string describe() const;

private:
  std::string name_;
  std::string namefile_ext_ = "nam";
  std::string version_;
  std::string exe_name_;
  std::string heading_;
  std::filesystem::path model_ws_;

  bool free_format_ = true;
  bool external_ = false;
  std::optional<std::filesystem::path> external_path_;
  int write_threads_ = 1;
  Log log_;

  PackageRegistry registry_;
  std::vector<std::unique_ptr<Package>> packages_;
  std::unique_ptr<GlobalPackage> glo_;
  std::unique_ptr<ListPackage> lst_;

  UnitTable unit_table_;
  std::vector<ExternalFileEntry> externals_;
  ExternalUnitAllocator allocator_;
  std::vector<int> pop_keys_;
  ParameterContext params_;
};

} // namespace mfnam
