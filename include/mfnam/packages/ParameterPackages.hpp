#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mfnam/core/Grid.hpp"
#include "mfnam/packages/Package.hpp"
#include "mfnam/packages/ParameterContext.hpp"

namespace mfnam {

// Packages whose content other packages reference by name (PVAL, ZONE,
// MULT). The loader resolves them into the model's ParameterContext before
// any other package is loaded.
class ParameterPackage : public Package {
public:
  using Package::Package;

  virtual void apply(ParameterContext& params) const = 0;
};

// PVAL: NPVAL, then one "PARNAM PARVAL" line per parameter.
class PvalPackage : public ParameterPackage {
public:
  PvalPackage(int unit, std::string filename);

  static std::unique_ptr<Package> load(LoadContext& ctx, const UnitTableEntry& entry);

  void apply(ParameterContext& params) const override;
  void write(const std::filesystem::path& workspace) const override;

  std::vector<std::pair<std::string, double>> values;
  std::vector<std::string> heading;
};

// ZONE: NZN, then for each zone a name line and an integer (nrow, ncol) array.
class ZonePackage : public ParameterPackage {
public:
  ZonePackage(int unit, std::string filename);

  static std::unique_ptr<Package> load(LoadContext& ctx, const UnitTableEntry& entry);

  void apply(ParameterContext& params) const override;
  void write(const std::filesystem::path& workspace) const override;

  std::vector<std::pair<std::string, Array2D<int>>> zones;
  std::vector<std::string> heading;
};

// MULT: NML, then for each multiplier a name line and a real (nrow, ncol)
// array. FUNCTION multipliers are rejected.
class MultPackage : public ParameterPackage {
public:
  MultPackage(int unit, std::string filename);

  static std::unique_ptr<Package> load(LoadContext& ctx, const UnitTableEntry& entry);

  void apply(ParameterContext& params) const override;
  void write(const std::filesystem::path& workspace) const override;

  std::vector<std::pair<std::string, Array2D<double>>> mults;
  std::vector<std::string> heading;
};

} // namespace mfnam
