#include "digest.h"

#include "mbedtls/md5.h"
#include "mbedtls/sha1.h"
#include "mbedtls/sha256.h"
#include "util.h"

#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dbuild {

namespace {

// Streams `file_path` through `update`, 1MB at a time.
template <typename Update>
void read_file_chunks(std::filesystem::path const &file_path,
                      char const *algorithm,
                      Update &&update) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error(std::string{ algorithm } +
                             ": file does not exist: " + file_path.string());
  }

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error(std::string{ algorithm } +
                             ": failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0 && update(buffer.data(), read_bytes) != 0) {
      throw std::runtime_error(std::string{ algorithm } + ": update failed");
    }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) {
        throw std::runtime_error(std::string{ algorithm } + ": fread failed");
      }
      break;
    }
  }
}

}  // namespace

std::string md5_file_hex(std::filesystem::path const &file_path) {
  mbedtls_md5_context ctx;
  mbedtls_md5_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_md5_free)> ctx_scope(&ctx,
                                                                         &mbedtls_md5_free);

  if (mbedtls_md5_starts(&ctx)) { throw std::runtime_error("md5: starts failed"); }

  read_file_chunks(file_path, "md5", [&](unsigned char const *data, size_t len) {
    return mbedtls_md5_update(&ctx, data, len);
  });

  std::array<unsigned char, 16> digest{};
  if (mbedtls_md5_finish(&ctx, digest.data())) {
    throw std::runtime_error("md5: finish failed");
  }
  return util_bytes_to_hex(digest.data(), digest.size());
}

std::string sha1_file_hex(std::filesystem::path const &file_path) {
  mbedtls_sha1_context ctx;
  mbedtls_sha1_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha1_free)> ctx_scope(
      &ctx,
      &mbedtls_sha1_free);

  if (mbedtls_sha1_starts(&ctx)) { throw std::runtime_error("sha1: starts failed"); }

  read_file_chunks(file_path, "sha1", [&](unsigned char const *data, size_t len) {
    return mbedtls_sha1_update(&ctx, data, len);
  });

  std::array<unsigned char, 20> digest{};
  if (mbedtls_sha1_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha1: finish failed");
  }
  return util_bytes_to_hex(digest.data(), digest.size());
}

std::string sha256_file_hex(std::filesystem::path const &file_path) {
  mbedtls_sha256_context ctx;
  mbedtls_sha256_init(&ctx);
  std::unique_ptr<decltype(ctx), decltype(&mbedtls_sha256_free)> ctx_scope(
      &ctx,
      &mbedtls_sha256_free);

  if (mbedtls_sha256_starts(&ctx, 0)) {
    throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
  }

  read_file_chunks(file_path, "sha256", [&](unsigned char const *data, size_t len) {
    return mbedtls_sha256_update(&ctx, data, len);
  });

  std::array<unsigned char, 32> digest{};
  if (mbedtls_sha256_finish(&ctx, digest.data())) {
    throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
  }
  return util_bytes_to_hex(digest.data(), digest.size());
}

std::string_view checksum_extension(checksum_algorithm algorithm) {
  switch (algorithm) {
    case checksum_algorithm::md5: return "md5";
    case checksum_algorithm::sha1: return "sha1";
  }
  return "";
}

std::string checksum_file_hex(checksum_algorithm algorithm,
                              std::filesystem::path const &file_path) {
  switch (algorithm) {
    case checksum_algorithm::md5: return md5_file_hex(file_path);
    case checksum_algorithm::sha1: return sha1_file_hex(file_path);
  }
  throw std::logic_error("checksum_file_hex: unknown algorithm");
}

}  // namespace dbuild
