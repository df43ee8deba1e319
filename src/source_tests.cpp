#include "source.h"

#include "errors.h"
#include "util.h"

#include "doctest.h"

#include <git2.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

struct source_fixture {
  fs::path dir{ fs::temp_directory_path() / "dbuild-source-test" };

  source_fixture() {
    fs::remove_all(dir);
    fs::create_directories(dir);
  }
  ~source_fixture() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  // Creates a repository with one commit containing README; returns the commit id
  std::string make_git_repo(fs::path const &path) {
    git_repository *repo{ nullptr };
    REQUIRE(git_repository_init(&repo, path.string().c_str(), 0) == 0);
    dbuild::util_write_file(path / "README", "hello");

    git_index *index{ nullptr };
    REQUIRE(git_repository_index(&index, repo) == 0);
    REQUIRE(git_index_add_bypath(index, "README") == 0);
    REQUIRE(git_index_write(index) == 0);
    git_oid tree_id;
    REQUIRE(git_index_write_tree(&tree_id, index) == 0);
    git_index_free(index);

    git_tree *tree{ nullptr };
    REQUIRE(git_tree_lookup(&tree, repo, &tree_id) == 0);
    git_signature *sig{ nullptr };
    REQUIRE(git_signature_now(&sig, "dbuild", "dbuild@example.com") == 0);

    git_oid commit_id;
    REQUIRE(git_commit_create_v(
                &commit_id, repo, "HEAD", sig, sig, nullptr, "initial", tree, 0) == 0);
    git_signature_free(sig);
    git_tree_free(tree);
    git_repository_free(repo);

    char hex[41]{};
    git_oid_tostr(hex, sizeof(hex), &commit_id);
    return hex;
  }
};

}  // namespace

TEST_CASE("source_parse schemes") {
  CHECK(dbuild::source_parse("nil").scheme == dbuild::source_scheme::nil);
  CHECK(dbuild::source_parse("nil:anything").scheme == dbuild::source_scheme::nil);

  auto const file{ dbuild::source_parse("file:/src/lib") };
  CHECK(file.scheme == dbuild::source_scheme::file);
  CHECK(file.location == "/src/lib");

  auto const git{ dbuild::source_parse("git:https://example.com/a#b.git#v1.0") };
  CHECK(git.scheme == dbuild::source_scheme::git);
  CHECK(git.location == "https://example.com/a#b.git");
  CHECK(git.ref == "v1.0");
}

TEST_CASE("source_parse rejects malformed uris") {
  CHECK_THROWS_AS(dbuild::source_parse("http://example.com"), dbuild::configuration_error);
  CHECK_THROWS_AS(dbuild::source_parse("git:https://example.com/x.git"),
                  dbuild::configuration_error);
  CHECK_THROWS_AS(dbuild::source_parse("git:https://example.com/x.git#"),
                  dbuild::configuration_error);
  CHECK_THROWS_AS(dbuild::source_parse("file:"), dbuild::configuration_error);
}

TEST_CASE_FIXTURE(source_fixture, "nil sources resolve to themselves and check out empty") {
  CHECK(dbuild::source_resolve("nil:") == "nil:");
  dbuild::source_checkout("nil:", dir / "out");
  CHECK(fs::is_directory(dir / "out"));
  CHECK(fs::is_empty(dir / "out"));
}

TEST_CASE_FIXTURE(source_fixture, "file sources resolve to an absolute path and copy") {
  dbuild::util_write_file(dir / "src" / "sub" / "a.txt", "a");

  auto const resolved{ dbuild::source_resolve("file:" + (dir / "src" / ".." / "src").string()) };
  CHECK(resolved == "file:" + (dir / "src").generic_string());
  CHECK(dbuild::source_resolve(resolved) == resolved);

  dbuild::util_write_file(dir / "out" / "stale.txt", "old");
  dbuild::source_checkout(resolved, dir / "out");
  CHECK(dbuild::util_load_text_file(dir / "out" / "sub" / "a.txt") == "a");
  CHECK_FALSE(fs::exists(dir / "out" / "stale.txt"));
}

TEST_CASE_FIXTURE(source_fixture, "file sources must exist") {
  CHECK_THROWS_AS(dbuild::source_resolve("file:" + (dir / "missing").string()),
                  std::runtime_error);
}

TEST_CASE_FIXTURE(source_fixture, "git refs are pinned to commit ids") {
  auto const commit{ make_git_repo(dir / "origin") };
  auto const uri{ "git:" + (dir / "origin").string() + "#HEAD" };

  auto const resolved{ dbuild::source_resolve(uri) };
  CHECK(resolved == "git:" + (dir / "origin").string() + "#" + commit);
  CHECK(dbuild::source_resolve(resolved) == resolved);

  dbuild::source_checkout(resolved, dir / "checkout");
  CHECK(dbuild::util_load_text_file(dir / "checkout" / "README") == "hello");
}

TEST_CASE_FIXTURE(source_fixture, "git unknown refs fail to resolve") {
  (void)make_git_repo(dir / "origin");
  auto const uri{ "git:" + (dir / "origin").string() + "#no-such-branch" };
  CHECK_THROWS_AS(dbuild::source_resolve(uri), std::runtime_error);
}

TEST_CASE("git checkout requires a pinned uri") {
  CHECK_THROWS_AS(dbuild::source_checkout("git:/tmp/x#main", "/tmp/dbuild-never"),
                  dbuild::internal_error);
}
