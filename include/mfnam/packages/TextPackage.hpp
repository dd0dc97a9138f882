#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "mfnam/packages/Package.hpp"
#include "mfnam/packages/PackageKind.hpp"

namespace mfnam {

// Package kept as the text it was read from and written back unchanged.
//
// Used for every registry kind whose data payload this library does not
// interpret. The loader still inspects the file for output units the package
// writes itself (cell-by-cell budget unit, OC head/drawdown units): those are
// claimed as internal and carried as companion file entries so the name file
// keeps them on write.
class TextPackage : public Package {
public:
  TextPackage(PackageKind kind, std::string filetype, int unit, std::string filename,
              std::vector<std::string> lines);

  template <PackageKind K>
  static std::unique_ptr<Package> load(LoadContext& ctx, const UnitTableEntry& entry) {
    return load_kind(K, std::string(package_kind_tag(K)), ctx, entry);
  }

  static std::unique_ptr<Package> load_kind(PackageKind kind, const std::string& filetype,
                                            LoadContext& ctx, const UnitTableEntry& entry);

  void write(const std::filesystem::path& workspace) const override;
  std::string describe() const override;

  const std::vector<std::string>& lines() const { return lines_; }

  // Output units found in the file, in the order they were found.
  static std::vector<int> scan_output_units(PackageKind kind, const std::vector<std::string>& lines);

private:
  std::vector<std::string> lines_;
};

} // namespace mfnam
