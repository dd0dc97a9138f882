#include <catch2/catch.hpp>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "TestUtils.hpp"
#include "mfnam/app/Loader.hpp"
#include "mfnam/core/Errors.hpp"
#include "mfnam/io/NameFile.hpp"
#include "mfnam/model/Model.hpp"
#include "mfnam/packages/Discretization.hpp"
#include "mfnam/packages/TextPackage.hpp"

using namespace mfnam;
namespace fs = std::filesystem;

namespace {

ModelOptions options_in(const mfnam_test::TempDir& d, std::ostream* log = nullptr) {
  ModelOptions opt;
  opt.model_ws = d.path();
  opt.log_stream = log;
  return opt;
}

std::unique_ptr<Package> text(PackageKind kind, const std::string& tag, int unit, const std::string& file) {
  return std::make_unique<TextPackage>(kind, tag, unit, file, std::vector<std::string>{"1 2 3"});
}

} // namespace

TEST_CASE("model construction", "[model]") {
  mfnam_test::TempDir d;

  Model m("demo", options_in(d));
  REQUIRE(m.version() == "mf2005");
  REQUIRE(m.namefile() == "demo.nam");
  REQUIRE(m.heading() == "# Name file for mf2005, generated by mfnam.");
  REQUIRE(m.global() == nullptr);
  REQUIRE(m.list().unit() == 2);
  REQUIRE(m.list().filename() == "demo.list");
  REQUIRE(m.packages().empty());
  REQUIRE(m.dis() == nullptr);
  REQUIRE(m.shape().empty());
  REQUIRE(m.describe() == "MODFLOW 0 layer(s), 0 row(s), 0 column(s), 0 stress period(s)");

  ModelOptions bad = options_in(d);
  bad.version = "mf6";
  CHECK_THROWS_AS(Model("x", bad), ConfigError);

  ModelOptions k2 = options_in(d);
  k2.version = "MF2K";
  Model old("old", k2);
  REQUIRE(old.version() == "mf2k");
  REQUIRE(old.global() != nullptr);
  REQUIRE(old.get_package("global")->filename() == "old.glo");
}

TEST_CASE("set_name renames the fixed files", "[model]") {
  mfnam_test::TempDir d;
  ModelOptions opt = options_in(d);
  opt.version = "mf2k";
  Model m("a", opt);
  m.set_name("b");
  REQUIRE(m.namefile() == "b.nam");
  REQUIRE(m.list().filename() == "b.list");
  REQUIRE(m.global()->filename() == "b.glo");
}

TEST_CASE("packages by filetype", "[model]") {
  mfnam_test::TempDir d;
  std::ostringstream log;
  Model m("demo", options_in(d, &log));

  auto dis = std::make_unique<Discretization>(11, "demo.dis");
  dis->nlay = 3;
  dis->nrow = 10;
  dis->ncol = 20;
  dis->nper = 2;
  m.add_package(std::move(dis));
  m.add_package(text(PackageKind::Wel, "WEL", 20, "demo.wel"));

  REQUIRE(m.shape().nlay == 3);
  REQUIRE(m.describe() == "MODFLOW 3 layer(s), 10 row(s), 20 column(s), 2 stress period(s)");
  REQUIRE(m.get_package("wel")->unit() == 20);
  REQUIRE(m.get_package("LIST") == &m.list());
  REQUIRE(m.get_package("RCH") == nullptr);

  m.add_package(text(PackageKind::Wel, "WEL", 21, "other.wel"));
  REQUIRE(m.packages().size() == 2);
  REQUIRE(m.get_package("WEL")->unit() == 21);
  REQUIRE_THAT(log.str(), Catch::Contains("replacing existing 'WEL'"));

  REQUIRE(m.remove_package("dis"));
  REQUIRE_FALSE(m.remove_package("dis"));
  REQUIRE(m.shape().empty());
}

TEST_CASE("external files", "[model]") {
  mfnam_test::TempDir d;
  std::ostringstream log;
  Model m("demo", options_in(d, &log));

  REQUIRE(m.next_ext_unit() == 1001);

  m.add_external("a.dat", 60);
  m.add_external(d.path() / "b.bin", 1500, true);
  REQUIRE(m.external_files().size() == 2);
  REQUIRE(m.external_files()[0].filename == d.path() / "a.dat");
  REQUIRE(m.next_ext_unit() == 1501);

  // same unit, new file: replaced
  m.add_external("c.dat", 60);
  REQUIRE(m.external_files().size() == 2);
  REQUIRE(m.external_files()[1].filename == d.path() / "c.dat");
  REQUIRE_THAT(log.str(), Catch::Contains("replacing existing unit 60"));

  // same file, new unit: replaced
  m.add_external("c.dat", 61);
  REQUIRE(m.external_files().size() == 2);
  REQUIRE(m.external_files()[1].unit == 61);

  REQUIRE(m.remove_external(61));
  REQUIRE_FALSE(m.remove_external(61));
  REQUIRE(m.remove_external(fs::path("b.bin")));
  REQUIRE(m.external_files().empty());
}

TEST_CASE("pop keys", "[model]") {
  Model m("demo");
  m.add_pop_key(50);
  m.add_pop_key(51);
  m.add_pop_key(50);
  REQUIRE(m.pop_keys() == std::vector<int>{50, 51});
  REQUIRE(m.is_pop_key(51));
  m.rollback_pop_keys(1);
  REQUIRE(m.pop_keys() == std::vector<int>{50});
  m.rollback_pop_keys(5);
  REQUIRE(m.pop_keys().size() == 1);
}

TEST_CASE("external_path is created", "[model]") {
  mfnam_test::TempDir d;
  ModelOptions opt = options_in(d);
  opt.external_path = fs::path("ext");
  Model m("demo", opt);
  REQUIRE(m.external());
  REQUIRE(fs::is_directory(d.path() / "ext"));
}

TEST_CASE("change_model_ws creates the directory", "[model]") {
  mfnam_test::TempDir d;
  Model m("demo", options_in(d));
  m.change_model_ws(d.path() / "nested" / "out");
  REQUIRE(fs::is_directory(d.path() / "nested" / "out"));
  REQUIRE(m.model_ws() == d.path() / "nested" / "out");
}

TEST_CASE("loaded model written elsewhere loads the same", "[model]") {
  mfnam_test::TempDir src;
  mfnam_test::write_basic_model(src);
  LoadRequest req;
  req.name_file = "test.nam";
  req.model_ws = src.path();
  LoadResult first = load_model(req);

  mfnam_test::TempDir dst;
  first.model.set_write_threads(2);
  first.model.change_model_ws(dst.path());
  first.model.write_input();

  for (const char* f : {"test.nam", "test.dis", "test.bas", "test.lpf", "test.wel", "test.oc", "test.pcg"}) {
    INFO(f);
    REQUIRE(fs::exists(dst.path() / f));
  }
  REQUIRE(mfnam_test::read_text(dst.path() / "test.wel") == mfnam_test::read_text(src.path() / "test.wel"));

  // Shared budget unit 51 appears once.
  const UnitTable written = NameFileCodec::parse(dst.path() / "test.nam");
  REQUIRE(written.units() == std::vector<int>{2, 11, 13, 15, 51, 20, 14, 50, 27, 60});
  REQUIRE(written.at(51).binary);
  REQUIRE(written.at(60).filetype == "DATA");

  req.model_ws = dst.path();
  LoadResult second = load_model(req);
  REQUIRE(second.model.package_names() == first.model.package_names());
  REQUIRE(second.model.describe() == first.model.describe());
  REQUIRE(second.model.external_files().size() == 1);
  REQUIRE(second.model.external_files()[0].unit == 60);
  REQUIRE(second.not_loaded.empty());
}

TEST_CASE("package files in subdirectories are written", "[model]") {
  mfnam_test::TempDir src;
  src.write("test.nam",
            "DIS   11 test.dis\n"
            "WEL   20 input/test.wel\n");
  src.write("test.dis", mfnam_test::kDis);
  src.write("input/test.wel", "1 0\n1\n1 1 1 -100.0\n");

  LoadRequest req;
  req.name_file = "test.nam";
  req.model_ws = src.path();
  LoadResult res = load_model(req);
  REQUIRE(res.model.get_package("WEL")->filename() == "input/test.wel");

  mfnam_test::TempDir dst;
  res.model.change_model_ws(dst.path());
  REQUIRE_NOTHROW(res.model.write_input());
  REQUIRE(mfnam_test::read_text(dst.path() / "input" / "test.wel") ==
          mfnam_test::read_text(src.path() / "input" / "test.wel"));

  const UnitTable written = NameFileCodec::parse(dst.path() / "test.nam");
  REQUIRE(written.at(20).filename == dst.path() / "input" / "test.wel");
}
