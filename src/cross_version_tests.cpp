#include "cross_version.h"

#include "errors.h"

#include "doctest.h"

namespace {

dbuild::core_module_rule const kRule{};

}  // namespace

TEST_CASE("cross_version_parse accepts the four modes") {
  CHECK(dbuild::cross_version_parse("disabled") == dbuild::cross_version_mode::disabled);
  CHECK(dbuild::cross_version_parse("full") == dbuild::cross_version_mode::full);
  CHECK(dbuild::cross_version_parse("binary") == dbuild::cross_version_mode::binary);
  CHECK(dbuild::cross_version_parse("standard") == dbuild::cross_version_mode::standard);
}

TEST_CASE("cross_version_parse rejects anything else") {
  CHECK_THROWS_AS(dbuild::cross_version_parse("binaryFull"), dbuild::configuration_error);
  CHECK_THROWS_AS(dbuild::cross_version_parse(""), dbuild::configuration_error);
  CHECK_THROWS_AS(dbuild::cross_version_parse("Full"), dbuild::configuration_error);
}

TEST_CASE("binary_version") {
  CHECK(dbuild::binary_version("2.11.0-M5") == "2.11");
  CHECK(dbuild::binary_version("2.11.4") == "2.11");
  CHECK(dbuild::binary_version("2.10") == "2.10");
  CHECK_THROWS_AS(dbuild::binary_version("2"), dbuild::consistency_error);
  CHECK_THROWS_AS(dbuild::binary_version("trunk"), dbuild::consistency_error);
  CHECK_THROWS_AS(dbuild::binary_version("2.11-"), dbuild::consistency_error);
}

TEST_CASE("cross_suffix: standard mode") {
  using dbuild::cross_version_mode;
  CHECK(dbuild::cross_suffix(cross_version_mode::standard, "2.11.0-M5", kRule) ==
        "_2.11.0-M5");
  CHECK(dbuild::cross_suffix(cross_version_mode::standard, "2.11.4", kRule) == "_2.11");
}

TEST_CASE("cross_suffix: binary and full modes") {
  using dbuild::cross_version_mode;
  CHECK(dbuild::cross_suffix(cross_version_mode::binary, "2.11.0-M5", kRule) == "_2.11");
  CHECK(dbuild::cross_suffix(cross_version_mode::full, "2.11.0-M5", kRule) ==
        "_2.11.0-M5");
  CHECK(dbuild::cross_suffix(cross_version_mode::full, "9.9.9", kRule) == "_9.9.9");
}

TEST_CASE("cross_suffix: disabled needs no core version") {
  using dbuild::cross_version_mode;
  CHECK(dbuild::cross_suffix(cross_version_mode::disabled, std::nullopt, kRule).empty());
  CHECK(dbuild::cross_suffix(cross_version_mode::disabled, "2.11.4", kRule).empty());
}

TEST_CASE("cross_suffix: missing core version is a consistency error") {
  using dbuild::cross_version_mode;
  for (auto mode : { cross_version_mode::full,
                     cross_version_mode::binary,
                     cross_version_mode::standard }) {
    try {
      (void)dbuild::cross_suffix(mode, std::nullopt, kRule);
      FAIL("expected consistency_error");
    } catch (dbuild::consistency_error const &e) {
      CHECK(std::string{ e.what() }.find("no scala-library was found") != std::string::npos);
    }
  }
}

TEST_CASE("fix_name strips cross-version suffixes") {
  CHECK(dbuild::fix_name("scala-xml_2.11.0-M5") == "scala-xml");
  CHECK(dbuild::fix_name("scala-xml_2.11") == "scala-xml");
  CHECK(dbuild::fix_name("addon_9.9.9") == "addon");
  CHECK(dbuild::fix_name("my_lib_2.10") == "my_lib");
  CHECK(dbuild::fix_name("scala-library") == "scala-library");
  CHECK(dbuild::fix_name("snake_case") == "snake_case");
  CHECK(dbuild::fix_name("_2.11") == "_2.11");
}

TEST_CASE("is_core_module: organization plus name prefix") {
  CHECK(dbuild::is_core_module(kRule, { "org.scala-lang", "scala-library" }));
  CHECK(dbuild::is_core_module(kRule, { "org.scala-lang", "scala-compiler" }));
  CHECK(dbuild::is_core_module(kRule, { "org.scala-lang.plugins", "continuations_2.10" }));
  CHECK_FALSE(dbuild::is_core_module(kRule, { "org.scala-lang.modules", "scala-xml" }));
  CHECK_FALSE(dbuild::is_core_module(kRule, { "org.x", "scala-library" }));
}

TEST_CASE("is_core_module: custom rule") {
  dbuild::core_module_rule const rule{ .organization = "org.x",
                                       .name_prefix = "core",
                                       .version_module = "core",
                                       .also = {} };
  CHECK(dbuild::is_core_module(rule, { "org.x", "core" }));
  CHECK(dbuild::is_core_module(rule, { "org.x", "core-macros_1.0" }));
  CHECK_FALSE(dbuild::is_core_module(rule, { "org.x", "addon" }));
  CHECK_FALSE(dbuild::is_core_module(rule, { "org.scala-lang.plugins", "continuations" }));
}

TEST_CASE("find_core_version uses the version module only") {
  std::vector<dbuild::artifact_location> arts{
    { .module = { "org.scala-lang", "scala-compiler" }, .version = "1.0" },
    { .module = { "org.scala-lang", "scala-library" }, .version = "2.11.4" },
  };
  CHECK(dbuild::find_core_version(kRule, arts) == "2.11.4");
  arts.pop_back();
  CHECK_FALSE(dbuild::find_core_version(kRule, arts).has_value());
}
