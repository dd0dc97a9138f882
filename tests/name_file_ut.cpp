#include <catch2/catch.hpp>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

#include "TestUtils.hpp"
#include "mfnam/core/Errors.hpp"
#include "mfnam/io/NameFile.hpp"
#include "mfnam/model/Model.hpp"
#include "mfnam/packages/Discretization.hpp"

using namespace mfnam;
namespace fs = std::filesystem;

namespace {

UnitTable parse_text(const std::string& text, const fs::path& base = "/model") {
  std::istringstream is(text);
  return NameFileCodec::parse(is, "test.nam", base);
}

std::size_t error_line(const std::string& text) {
  try {
    parse_text(text);
  } catch (const FormatError& e) {
    return e.line();
  }
  FAIL("expected FormatError");
  return 0;
}

} // namespace

TEST_CASE("name file parse", "[namefile]") {
  const UnitTable t = parse_text(
      "# heading\n"
      "\n"
      "list 2 model.list\n"
      "  DIS   11   model.dis\n"
      "bas6,13,model.bas\n"
      "DATA(BINARY) 50 out/model.hds REPLACE\n"
      "data 60 /abs/heads.dat old\n");

  REQUIRE(t.size() == 5);
  REQUIRE(t.units() == std::vector<int>{2, 11, 13, 50, 60});

  const auto& dis = t.at(11);
  REQUIRE(dis.filetype == "DIS");
  REQUIRE(dis.filename == fs::path("/model/model.dis"));
  REQUIRE(dis.line == 4);
  REQUIRE_FALSE(dis.binary);
  REQUIRE(dis.option.empty());

  REQUIRE(t.at(13).filetype == "BAS6");

  const auto& hds = t.at(50);
  REQUIRE(hds.binary);
  REQUIRE(hds.option == "REPLACE");
  REQUIRE(hds.filename == fs::path("/model/out/model.hds"));

  const auto& dat = t.at(60);
  REQUIRE(dat.filename == fs::path("/abs/heads.dat"));
  REQUIRE(dat.option == "OLD");
}

TEST_CASE("name file parse errors carry the line number", "[namefile]") {
  REQUIRE(error_line("# h\nDIS 11\n") == 2);
  REQUIRE(error_line("DIS 11 a.dis\nBAS6 x a.bas\n") == 2);
  REQUIRE(error_line("DIS 0 a.dis\n") == 1);
  REQUIRE(error_line("DIS -4 a.dis\n") == 1);
  REQUIRE(error_line("DIS 11 a.dis OLD extra\n") == 1);
  REQUIRE(error_line("DIS 11 a.dis SCRATCH\n") == 1);
  REQUIRE(error_line("\n\nDIS 11 a.dis\n# c\nBAS6 11 a.bas\n") == 5);

  try {
    parse_text("DIS 11 a.dis\nBAS6 11 a.bas\n");
    FAIL("expected FormatError");
  } catch (const FormatError& e) {
    REQUIRE_THAT(std::string(e.what()), Catch::Contains("already assigned on line 1"));
  }
}

TEST_CASE("name file parse from disk", "[namefile]") {
  mfnam_test::TempDir d;
  d.write("m.nam", "DIS 11 m.dis\nWEL 20 sub/m.wel\n");

  const UnitTable t = NameFileCodec::parse(d.path() / "m.nam");
  REQUIRE(t.at(20).filename == (d.path() / "sub/m.wel").lexically_normal());

  CHECK_THROWS_AS(NameFileCodec::parse(d.path() / "missing.nam"), IoError);
}

TEST_CASE("name file write", "[namefile]") {
  mfnam_test::TempDir d;
  ModelOptions opt;
  opt.model_ws = d.path();
  Model m("demo", opt);
  m.add_package(std::make_unique<Discretization>(11, "demo.dis"));
  m.add_external(d.path() / "a.dat", 1001, false);
  m.add_external("b.bin", 1002, true);

  std::ostringstream os;
  NameFileCodec::write(m, os);
  const std::string text = os.str();

  REQUIRE(text.rfind("# Name file for mf2005", 0) == 0);
  REQUIRE_THAT(text, Catch::Contains("demo.list"));
  REQUIRE_THAT(text, Catch::Contains("DATA(BINARY)  1002  b.bin REPLACE"));
  REQUIRE_THAT(text, Catch::Contains("DATA          1001  a.dat"));

  const UnitTable back = parse_text(text, d.path());
  REQUIRE(back.units() == std::vector<int>{2, 11, 1001, 1002});
  REQUIRE(back.at(2).filetype == "LIST");
  REQUIRE(back.at(11).filename == d.path() / "demo.dis");
  REQUIRE(back.at(1002).binary);
  REQUIRE_FALSE(back.at(1001).binary);
}

TEST_CASE("name file write for mf2k starts with GLOBAL", "[namefile]") {
  mfnam_test::TempDir d;
  ModelOptions opt;
  opt.version = "mf2k";
  opt.model_ws = d.path();
  Model m("old", opt);

  std::ostringstream os;
  NameFileCodec::write(m, os);
  const UnitTable back = parse_text(os.str(), d.path());
  REQUIRE(back.units() == std::vector<int>{1, 2});
  REQUIRE(back.at(1).filetype == "GLOBAL");
  REQUIRE(back.at(1).filename == d.path() / "old.glo");
}
