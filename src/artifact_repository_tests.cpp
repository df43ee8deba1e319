#include "artifact_repository.h"

#include "digest.h"
#include "doctest.h"
#include "util.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

struct repository_fixture {
  fs::path base{ fs::temp_directory_path() / "dbuild-repository-test" };
  fs::path local_repo{ base / "local" };
  fs::path target_repo{ base / "target" };

  repository_fixture() {
    fs::remove_all(base);
    fs::create_directories(local_repo);
  }
  ~repository_fixture() {
    std::error_code ec;
    fs::remove_all(base, ec);
  }

  dbuild::build_artifacts_out write_module(std::string const &content) {
    auto const rel{ fs::path{ "org" } / "x" / "core" / "1.0" / "core-1.0.jar" };
    dbuild::util_write_file(local_repo / rel, content);

    dbuild::build_subartifacts_out sub{ .subproject = "core" };
    sub.artifacts.push_back({ .module = { "org.x", "core" },
                              .artifact = {},
                              .cross_suffix = "",
                              .path = rel.generic_string(),
                              .version = "1.0" });
    sub.shas.push_back(
        dbuild::artifact_repository::make_artifact_sha(local_repo / rel, local_repo));
    return { .results = { sub } };
  }
};

}  // namespace

TEST_CASE("artifact index: write and read preserve every field") {
  dbuild::build_subartifacts_out sub{ .subproject = "lib-core" };
  sub.artifacts.push_back({ .module = { "org.x", "core" },
                            .artifact = { "pom", "sources" },
                            .cross_suffix = "_2.11",
                            .path = "org/x/core_2.11/1.0/core_2.11-1.0.pom",
                            .version = "1.0" });
  sub.shas.push_back({ .sha = "abc", .location = "org/x/core_2.11/1.0/core_2.11-1.0.pom" });

  auto const text{ dbuild::artifact_index_write({ .results = { sub } }) };
  auto const back{ dbuild::artifact_index_read(text) };

  REQUIRE(back.results.size() == 1);
  CHECK(back.results[0].subproject == "lib-core");
  REQUIRE(back.results[0].artifacts.size() == 1);
  auto const &a{ back.results[0].artifacts[0] };
  CHECK(a.module.key() == "org.x#core");
  CHECK(a.artifact.extension == "pom");
  CHECK(a.artifact.classifier == "sources");
  CHECK(a.cross_suffix == "_2.11");
  CHECK(a.version == "1.0");
  REQUIRE(back.results[0].shas.size() == 1);
  CHECK(back.results[0].shas[0].sha == "abc");
}

TEST_CASE("artifact index: rejects malformed input") {
  CHECK_THROWS(dbuild::artifact_index_read("not an index\n"));
  CHECK_THROWS(dbuild::artifact_index_read("dbuild-artifacts 1\nsha\tabc\tloc\n"));
}

TEST_CASE("artifact index: rejects tabs in fields") {
  dbuild::build_subartifacts_out sub{ .subproject = "bad\tname" };
  CHECK_THROWS(dbuild::artifact_index_write({ .results = { sub } }));
}

TEST_CASE_FIXTURE(repository_fixture, "artifact_repository: make_artifact_sha") {
  dbuild::util_write_file(local_repo / "a" / "b.txt", "abc");
  auto const sha{ dbuild::artifact_repository::make_artifact_sha(local_repo / "a" / "b.txt",
                                                                 local_repo) };
  CHECK(sha.location == "a/b.txt");
  CHECK(sha.sha == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE_FIXTURE(repository_fixture, "artifact_repository: lookup of unknown uuid") {
  dbuild::artifact_repository repo{ base / "repo" };
  CHECK_FALSE(repo.lookup("nope").has_value());
  CHECK_THROWS_AS(repo.retrieve({ "nope" }, target_repo), std::runtime_error);
}

TEST_CASE_FIXTURE(repository_fixture, "artifact_repository: publish then retrieve") {
  dbuild::artifact_repository repo{ base / "repo" };
  auto const out{ write_module("jar-bytes") };

  repo.publish("uuid-1", local_repo, out);

  auto const found{ repo.lookup("uuid-1") };
  REQUIRE(found.has_value());
  REQUIRE(found->results.size() == 1);
  CHECK(found->results[0].shas[0].sha == out.results[0].shas[0].sha);

  fs::remove_all(local_repo);  // the repository must not depend on the build dir

  auto const locations{ repo.retrieve({ "uuid-1" }, target_repo) };
  REQUIRE(locations.size() == 1);
  auto const file{ target_repo / locations[0].path };
  REQUIRE(fs::exists(file));
  CHECK(dbuild::util_load_text_file(file) == "jar-bytes");
}

TEST_CASE_FIXTURE(repository_fixture, "artifact_repository: publish is idempotent") {
  dbuild::artifact_repository repo{ base / "repo" };
  auto const out{ write_module("same") };
  repo.publish("uuid-2", local_repo, out);
  CHECK_NOTHROW(repo.publish("uuid-2", local_repo, out));

  std::size_t tmp_entries{ 0 };
  for (auto const &entry : fs::directory_iterator{ repo.root() }) {
    if (entry.path().filename().string().starts_with(".tmp-")) { ++tmp_entries; }
  }
  CHECK(tmp_entries == 0);
}

TEST_CASE_FIXTURE(repository_fixture,
                  "artifact_repository: publish detects files changed after hashing") {
  dbuild::artifact_repository repo{ base / "repo" };
  auto const out{ write_module("original") };
  dbuild::util_write_file(local_repo / out.results[0].artifacts[0].path, "tampered");

  CHECK_THROWS_AS(repo.publish("uuid-3", local_repo, out), std::runtime_error);
  CHECK_FALSE(repo.lookup("uuid-3").has_value());
}
