#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "mfnam/packages/Package.hpp"
#include "mfnam/packages/PackageKind.hpp"

namespace mfnam {

struct PackageFactoryEntry {
  std::string filetype; // name file tag, matched case-insensitively
  PackageKind kind = PackageKind::Custom;
  LoadFn load = nullptr;
};

// Filetype tag -> package loader.
//
// Not a process-wide singleton: every Model owns its own copy, seeded from
// builtin(), so factories registered on one model never leak into another.
class PackageRegistry {
public:
  // The loaders shipped with the library (ZONE, MULT, PVAL, BAS6, DIS, BCF6,
  // LPF, HFB6, CHD, WEL, DRN, RCH, EVT, GHB, GMG, RIV, STR, SWI2, PCG, PCGN,
  // NWT, PKS, SFR, SIP, SOR, DE4, OC, UZF, UPW).
  static PackageRegistry builtin();

  // Throws std::runtime_error on an empty tag, a null loader or a tag that is
  // already registered.
  void register_factory(PackageFactoryEntry e);

  // Register or replace.
  void override_factory(PackageFactoryEntry e);

  bool unregister(std::string_view filetype);

  // nullptr for unknown tags; the loader treats those as external data or
  // skips them.
  const PackageFactoryEntry* resolve(std::string_view filetype) const;

  bool has(std::string_view filetype) const { return resolve(filetype) != nullptr; }

  // Like resolve() but throws std::runtime_error listing the registered tags.
  const PackageFactoryEntry& require(std::string_view filetype) const;

  // Sorted.
  std::vector<std::string> registered_types() const;

  std::size_t size() const { return factories_.size(); }

private:
  std::unordered_map<std::string, PackageFactoryEntry> factories_; // keyed by upper-case tag

  static void validate_(const PackageFactoryEntry& e);
};

} // namespace mfnam
