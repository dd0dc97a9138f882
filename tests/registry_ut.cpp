#include <catch2/catch.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "mfnam/model/Model.hpp"
#include "mfnam/packages/PackageRegistry.hpp"
#include "mfnam/packages/TextPackage.hpp"

using namespace mfnam;

namespace {

std::unique_ptr<Package> load_nothing(LoadContext&, const UnitTableEntry&) {
  return nullptr;
}

} // namespace

TEST_CASE("builtin registry", "[registry]") {
  const PackageRegistry r = PackageRegistry::builtin();
  REQUIRE(r.size() == 29);

  const std::vector<std::string> expected{
      "BAS6", "BCF6", "CHD", "DE4", "DIS", "DRN", "EVT", "GHB", "GMG", "HFB6",
      "LPF", "MULT", "NWT", "OC", "PCG", "PCGN", "PKS", "PVAL", "RCH", "RIV",
      "SFR", "SIP", "SOR", "STR", "SWI2", "UPW", "UZF", "WEL", "ZONE"};
  REQUIRE(r.registered_types() == expected);

  REQUIRE(r.resolve("dis") != nullptr);
  REQUIRE(r.resolve("Dis")->kind == PackageKind::Dis);
  REQUIRE(r.resolve("wel")->filetype == "WEL");
  REQUIRE(r.resolve("DATA") == nullptr);
  REQUIRE(r.resolve("LIST") == nullptr);
  REQUIRE(r.resolve("GLOBAL") == nullptr);
  REQUIRE_FALSE(r.has("FOO"));
  REQUIRE(r.require("oc").kind == PackageKind::Oc);
  CHECK_THROWS_AS(r.require("FOO"), std::runtime_error);
}

TEST_CASE("registry registration rules", "[registry]") {
  PackageRegistry r = PackageRegistry::builtin();

  CHECK_THROWS_AS(r.register_factory({"wel", PackageKind::Wel, &load_nothing}), std::runtime_error);
  CHECK_THROWS_AS(r.register_factory({"", PackageKind::Custom, &load_nothing}), std::runtime_error);
  CHECK_THROWS_AS(r.register_factory({"FOO", PackageKind::Custom, nullptr}), std::runtime_error);

  r.register_factory({"foo", PackageKind::Custom, &load_nothing});
  REQUIRE(r.has("FOO"));
  REQUIRE(r.resolve("foo")->filetype == "FOO");
  REQUIRE(r.size() == 30);

  r.override_factory({"WEL", PackageKind::Custom, &load_nothing});
  REQUIRE(r.resolve("WEL")->load == &load_nothing);
  REQUIRE(r.size() == 30);

  REQUIRE(r.unregister("foo"));
  REQUIRE_FALSE(r.unregister("foo"));
  REQUIRE(r.size() == 29);
}

TEST_CASE("each model owns its registry", "[registry]") {
  Model a("a");
  Model b("b");

  a.registry().register_factory({"FOO", PackageKind::Custom, &load_nothing});
  a.registry().unregister("WEL");

  REQUIRE(a.registry().has("FOO"));
  REQUIRE_FALSE(b.registry().has("FOO"));
  REQUIRE(b.registry().has("WEL"));
  REQUIRE_FALSE(PackageRegistry::builtin().has("FOO"));
}
