#include "mfnam/packages/PackageRegistry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "mfnam/packages/Discretization.hpp"
#include "mfnam/packages/ParameterPackages.hpp"
#include "mfnam/packages/TextPackage.hpp"
#include "mfnam/util/Parse.hpp"

namespace mfnam {

namespace {

template <PackageKind K>
PackageFactoryEntry text_entry() {
  return PackageFactoryEntry{std::string(package_kind_tag(K)), K, &TextPackage::load<K>};
}

} // namespace

PackageRegistry PackageRegistry::builtin() {
  PackageRegistry r;
  r.register_factory({"ZONE", PackageKind::Zone, &ZonePackage::load});
  r.register_factory({"MULT", PackageKind::Mult, &MultPackage::load});
  r.register_factory({"PVAL", PackageKind::Pval, &PvalPackage::load});
  r.register_factory(text_entry<PackageKind::Bas6>());
  r.register_factory({"DIS", PackageKind::Dis, &Discretization::load});
  r.register_factory(text_entry<PackageKind::Bcf6>());
  r.register_factory(text_entry<PackageKind::Lpf>());
  r.register_factory(text_entry<PackageKind::Hfb6>());
  r.register_factory(text_entry<PackageKind::Chd>());
  r.register_factory(text_entry<PackageKind::Wel>());
  r.register_factory(text_entry<PackageKind::Drn>());
  r.register_factory(text_entry<PackageKind::Rch>());
  r.register_factory(text_entry<PackageKind::Evt>());
  r.register_factory(text_entry<PackageKind::Ghb>());
  r.register_factory(text_entry<PackageKind::Gmg>());
  r.register_factory(text_entry<PackageKind::Riv>());
  r.register_factory(text_entry<PackageKind::Str>());
  r.register_factory(text_entry<PackageKind::Swi2>());
  r.register_factory(text_entry<PackageKind::Pcg>());
  r.register_factory(text_entry<PackageKind::Pcgn>());
  r.register_factory(text_entry<PackageKind::Nwt>());
  r.register_factory(text_entry<PackageKind::Pks>());
  r.register_factory(text_entry<PackageKind::Sfr>());
  r.register_factory(text_entry<PackageKind::Sip>());
  r.register_factory(text_entry<PackageKind::Sor>());
  r.register_factory(text_entry<PackageKind::De4>());
  r.register_factory(text_entry<PackageKind::Oc>());
  r.register_factory(text_entry<PackageKind::Uzf>());
  r.register_factory(text_entry<PackageKind::Upw>());
  return r;
}

void PackageRegistry::validate_(const PackageFactoryEntry& e) {
  if (e.filetype.empty()) throw std::runtime_error("PackageRegistry: factory filetype is empty");
  if (!e.load) throw std::runtime_error("PackageRegistry: factory entry missing loader for filetype='" + e.filetype + "'");
}

void PackageRegistry::register_factory(PackageFactoryEntry e) {
  validate_(e);
  const std::string key = to_upper(e.filetype);
  if (factories_.find(key) != factories_.end()) {
    throw std::runtime_error("PackageRegistry: duplicate factory registration for filetype='" + key + "'");
  }
  e.filetype = key;
  factories_.emplace(key, std::move(e));
}

void PackageRegistry::override_factory(PackageFactoryEntry e) {
  validate_(e);
  const std::string key = to_upper(e.filetype);
  e.filetype = key;
  factories_[key] = std::move(e);
}

bool PackageRegistry::unregister(std::string_view filetype) {
  return factories_.erase(to_upper(filetype)) > 0;
}

const PackageFactoryEntry* PackageRegistry::resolve(std::string_view filetype) const {
  auto it = factories_.find(to_upper(filetype));
  if (it == factories_.end()) return nullptr;
  return &it->second;
}

const PackageFactoryEntry& PackageRegistry::require(std::string_view filetype) const {
  if (const auto* e = resolve(filetype)) return *e;
  std::string msg = "PackageRegistry: unknown filetype '" + std::string(filetype) + "'. Registered types:";
  for (const auto& k : registered_types()) msg += " " + k;
  throw std::runtime_error(msg);
}

std::vector<std::string> PackageRegistry::registered_types() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& kv : factories_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace mfnam
