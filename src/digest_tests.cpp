#include "digest.h"

#include "doctest.h"
#include "util.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace {

struct abc_file {
  fs::path path{ fs::temp_directory_path() / "dbuild-digest-abc.txt" };
  abc_file() { dbuild::util_write_file(path, "abc"); }
  ~abc_file() {
    std::error_code ec;
    fs::remove(path, ec);
  }
};

}  // namespace

TEST_CASE_FIXTURE(abc_file, "md5_file_hex computes known hash") {
  CHECK(dbuild::md5_file_hex(path) == "900150983cd24fb0d6963f7d28e17f72");
}

TEST_CASE_FIXTURE(abc_file, "sha1_file_hex computes known hash") {
  CHECK(dbuild::sha1_file_hex(path) == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE_FIXTURE(abc_file, "sha256_file_hex computes known hash") {
  CHECK(dbuild::sha256_file_hex(path) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE_FIXTURE(abc_file, "checksum_file_hex dispatches by algorithm") {
  CHECK(dbuild::checksum_file_hex(dbuild::checksum_algorithm::md5, path) ==
        dbuild::md5_file_hex(path));
  CHECK(dbuild::checksum_file_hex(dbuild::checksum_algorithm::sha1, path) ==
        dbuild::sha1_file_hex(path));
  CHECK(dbuild::checksum_extension(dbuild::checksum_algorithm::sha1) == "sha1");
}

TEST_CASE("sha256_file_hex throws for missing file") {
  auto const missing{ fs::temp_directory_path() / "dbuild-digest-missing.txt" };
  CHECK_FALSE(fs::exists(missing));
  CHECK_THROWS(dbuild::sha256_file_hex(missing));
}
