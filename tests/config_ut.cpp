#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "TestUtils.hpp"
#include "mfnam/config/IniConfig.hpp"
#include "mfnam/config/LoadOptions.hpp"
#include "mfnam/core/Errors.hpp"
#include "mfnam/util/Parse.hpp"

using namespace mfnam;
namespace fs = std::filesystem;

namespace {

IniConfig ini(const std::string& text, const fs::path& source = "/cfg/run.ini") {
  std::istringstream is(text);
  return IniConfig(is, source);
}

} // namespace

TEST_CASE("ini parsing", "[config]") {
  const IniConfig cfg = ini(
      "# comment\n"
      "; another\n"
      "[model]\n"
      "name_file = \"my model.nam\"\n"
      "  verbose=yes\n"
      "load_only = WEL, rch ,, OC\n"
      "\n"
      "[write]\n"
      "threads = 4\n"
      "output_ws = 'out'\n");

  REQUIRE(cfg.section_names() == std::vector<std::string>{"model", "write"});
  REQUIRE(cfg.get_string("model", "name_file") == "my model.nam");
  REQUIRE(cfg.get_bool("model", "verbose"));
  REQUIRE(cfg.get_list("model", "load_only") == std::vector<std::string>{"WEL", "rch", "OC"});
  REQUIRE(cfg.get_int64("write", "threads") == 4);
  REQUIRE(cfg.get_string("write", "output_ws") == "out");
  REQUIRE(cfg.get_path("write", "output_ws").value() == fs::path("/cfg/out"));
  REQUIRE_FALSE(cfg.get_path("write", "report").has_value());

  REQUIRE(cfg.get_string("model", "version", std::string("mf2005")) == "mf2005");
  REQUIRE(cfg.get_int64("write", "missing", 7) == 7);
  REQUIRE_FALSE(cfg.has_key("model", "exe_name"));
  REQUIRE_FALSE(cfg.has_section("topology"));

  CHECK_THROWS_AS(cfg.get_string("model", "exe_name"), ConfigError);
  CHECK_THROWS_AS(cfg.get_int64("model", "verbose"), ConfigError);
  CHECK_THROWS_AS(cfg.get_bool("model", "name_file"), ConfigError);
}

TEST_CASE("ini syntax errors", "[config]") {
  CHECK_THROWS_AS(ini("key = 1\n"), ConfigError);
  CHECK_THROWS_AS(ini("[]\n"), ConfigError);
  CHECK_THROWS_AS(ini("[model]\nno equals sign\n"), ConfigError);
  CHECK_THROWS_AS(ini("[model]\n = 3\n"), ConfigError);
  CHECK_THROWS_AS(IniConfig(fs::path("/nonexistent/run.ini")), ConfigError);
}

TEST_CASE("load options from ini", "[config]") {
  mfnam_test::TempDir d;
  const auto p = d.write("run.ini",
                         "[model]\n"
                         "name_file = test.nam\n"
                         "model_ws = model\n"
                         "version = mfnwt\n"
                         "load_only = wel,rch\n"
                         "\n"
                         "[write]\n"
                         "output_ws = out\n"
                         "threads = 3\n"
                         "report = load.json\n");

  const LoadOptions o = LoadOptions::from_ini(IniConfig(p));
  REQUIRE(o.request.name_file == fs::path("test.nam"));
  REQUIRE(o.request.model_ws == d.path() / "model");
  REQUIRE(o.request.version == "mfnwt");
  REQUIRE(o.request.exe_name == "mf2005");
  REQUIRE_FALSE(o.request.verbose);
  REQUIRE(o.request.load_only.value() == std::vector<std::string>{"wel", "rch"});
  REQUIRE(o.output_ws.value() == d.path() / "out");
  REQUIRE(o.report.value() == d.path() / "load.json");
  REQUIRE(o.threads == 3);
}

TEST_CASE("load options defaults", "[config]") {
  const LoadOptions o = LoadOptions::from_ini(ini("[model]\nname_file = a.nam\n"));
  REQUIRE(o.request.model_ws == fs::path("/cfg"));
  REQUIRE_FALSE(o.request.load_only.has_value());
  REQUIRE_FALSE(o.output_ws.has_value());
  REQUIRE(o.threads == 1);

  CHECK_THROWS_AS(LoadOptions::from_ini(ini("[write]\nthreads = 2\n")), ConfigError);
  CHECK_THROWS_AS(LoadOptions::from_ini(ini("[model]\nname_file = a\n[write]\nthreads = 0\n")), ConfigError);
}

TEST_CASE("comma lists", "[config]") {
  REQUIRE(split_list("WEL,rch") == std::vector<std::string>{"WEL", "rch"});
  REQUIRE(split_list(" a , b,,c ,") == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(split_list("").empty());
  REQUIRE(split_list(" , ").empty());
}
