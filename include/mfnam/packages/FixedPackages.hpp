#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "mfnam/packages/Package.hpp"

namespace mfnam {

// GLOBAL (mf2k only) and LIST are always present on a model and never come
// from the registry. Their files are produced by the simulator, so write()
// has nothing to do.

class GlobalPackage : public Package {
public:
  GlobalPackage(int unit, std::string filename)
  : Package(PackageKind::Global, "GLOBAL", {PackageFile{"GLOBAL", unit, std::move(filename)}}) {}

  void write(const std::filesystem::path&) const override {}
};

class ListPackage : public Package {
public:
  ListPackage(int unit, std::string filename)
  : Package(PackageKind::List, "LIST", {PackageFile{"LIST", unit, std::move(filename)}}) {}

  void write(const std::filesystem::path&) const override {}
};

} // namespace mfnam
