#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dbuild {

// File digests used for repository checksum side-files and content addressing.
// All return lowercase hex; all throw std::runtime_error on I/O or mbedTLS failure.
std::string md5_file_hex(std::filesystem::path const &file_path);
std::string sha1_file_hex(std::filesystem::path const &file_path);
std::string sha256_file_hex(std::filesystem::path const &file_path);

// Checksum algorithms written beside repository files as `<file>.<name>`
enum class checksum_algorithm { md5, sha1 };

std::string_view checksum_extension(checksum_algorithm algorithm);
std::string checksum_file_hex(checksum_algorithm algorithm,
                              std::filesystem::path const &file_path);

}  // namespace dbuild
