#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mfnam/core/Grid.hpp"
#include "mfnam/core/UnitTable.hpp"
#include "mfnam/packages/PackageKind.hpp"
#include "mfnam/packages/ParameterContext.hpp"
#include "mfnam/util/Log.hpp"

namespace mfnam {

// One name file line owned by a package. `filename` is relative to the model
// workspace.
struct PackageFile {
  std::string name;
  int unit = 0;
  std::string filename;
};

// What a package loader may see of the model under construction.
//
// Packages never hold a reference to the Model. The context gives read access
// to the working unit table (for packages that reference other units), the
// parameter substitution context and the grid shape, and lets a loader claim
// units that turn out to be internal to it (budget output, EXTERNAL arrays).
class LoadContext {
public:
  LoadContext(std::filesystem::path workspace,
              const UnitTable& units,
              const ParameterContext& params,
              GridShape grid,
              std::vector<int>& claimed_units,
              const Log& log)
  : workspace_(std::move(workspace)),
    units_(units),
    params_(params),
    grid_(grid),
    claimed_(claimed_units),
    log_(log) {}

  const std::filesystem::path& workspace() const { return workspace_; }
  const UnitTable& units() const { return units_; }
  const ParameterContext& params() const { return params_; }
  const GridShape& grid() const { return grid_; }
  const Log& log() const { return log_; }

  void claim_unit(int unit) {
    if (unit <= 0) return;
    if (std::find(claimed_.begin(), claimed_.end(), unit) == claimed_.end()) claimed_.push_back(unit);
  }

private:
  std::filesystem::path workspace_;
  const UnitTable& units_;
  const ParameterContext& params_;
  GridShape grid_;
  std::vector<int>& claimed_;
  const Log& log_;
};

class Package {
public:
  Package(PackageKind kind, std::string filetype, std::vector<PackageFile> files)
  : kind_(kind), filetype_(std::move(filetype)), files_(std::move(files)) {}

  virtual ~Package() = default;

  PackageKind kind() const { return kind_; }

  // Name file filetype tag, upper case (e.g. "DIS").
  const std::string& filetype() const { return filetype_; }

  // All (name, unit, filename) triples; the first is the package input file.
  const std::vector<PackageFile>& files() const { return files_; }

  int unit() const { return files_.empty() ? 0 : files_.front().unit; }
  std::string filename() const { return files_.empty() ? std::string() : files_.front().filename; }

  void set_file(std::size_t i, PackageFile f) { files_.at(i) = std::move(f); }

  // Write the package input file(s) into `workspace`. Throws IoError.
  virtual void write(const std::filesystem::path& workspace) const = 0;

  virtual std::string describe() const { return filetype_ + " package"; }

protected:
  PackageKind kind_;
  std::string filetype_;
  std::vector<PackageFile> files_;
};

// Registry loader: build a package from its name file entry. Throws
// PackageLoadError (or any std::exception) on failure.
using LoadFn = std::unique_ptr<Package> (*)(LoadContext& ctx, const UnitTableEntry& entry);

} // namespace mfnam
