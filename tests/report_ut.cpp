#include <catch2/catch.hpp>

#include <sstream>
#include <string>

#include "TestUtils.hpp"
#include "mfnam/app/Loader.hpp"
#include "mfnam/output/LoadReport.hpp"

using namespace mfnam;

TEST_CASE("json escaping", "[report]") {
  REQUIRE(output::json_escape("plain") == "plain");
  REQUIRE(output::json_escape("a\"b\\c") == "a\\\"b\\\\c");
  REQUIRE(output::json_escape("tab\tnl\n") == "tab\\tnl\\n");
  REQUIRE(output::json_escape(std::string(1, '\x01')) == "\\u0001");
}

TEST_CASE("load report", "[report]") {
  mfnam_test::TempDir d;
  mfnam_test::write_basic_model(d);
  fs::remove(d.path() / "test.pcg");

  LoadRequest req;
  req.name_file = "test.nam";
  req.model_ws = d.path();
  const LoadResult res = load_model(req);

  std::ostringstream os;
  output::write_load_report_json(os, res);
  const std::string json = os.str();

  REQUIRE_THAT(json, Catch::Contains("\"schema_version\": \"1.0\""));
  REQUIRE_THAT(json, Catch::Contains("\"name\": \"test\""));
  REQUIRE_THAT(json, Catch::Contains("\"version\": \"mf2005\""));
  REQUIRE_THAT(json, Catch::Contains("\"shape\": {\"nlay\": 1, \"nrow\": 2, \"ncol\": 3, \"nper\": 1}"));
  REQUIRE_THAT(json, Catch::Contains("\"not_loaded\": [\"test.pcg\"]"));
  REQUIRE_THAT(json, Catch::Contains("{\"name\": \"DATA(BINARY)\", \"unit\": 51, \"filename\": \"test.cbc\"}"));
  REQUIRE_THAT(json, Catch::Contains("{\"unit\": 60, \"filename\": \"heads.dat\", \"binary\": false}"));
  REQUIRE_THAT(json, Catch::Contains("\"unclaimed_units\": [27, 60]"));

  const auto path = d.path() / "report.json";
  output::write_load_report_json(path, res);
  REQUIRE(mfnam_test::read_text(path) == json);
}
