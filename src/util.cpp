#include "util.h"

#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace dbuild {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }

  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file: short write: " + path.string());
  }

  if (std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_file: failed to flush: " + path.string());
  }
}

std::vector<std::string> util_split(std::string_view text, char delim) {
  std::vector<std::string> out;
  std::size_t start{ 0 };
  for (;;) {
    auto const pos{ text.find(delim, start) };
    if (pos == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      return out;
    }
    out.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string util_tail_lines(std::string_view text, std::size_t max_lines) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }

  std::size_t seen{ 0 };
  for (std::size_t i{ text.size() }; i > 0; --i) {
    if (text[i - 1] == '\n' && ++seen == max_lines) {
      return std::string{ text.substr(i) };
    }
  }
  return std::string{ text };
}

std::string util_relative_generic(std::filesystem::path const &path,
                                  std::filesystem::path const &root) {
  return path.lexically_relative(root).generic_string();
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace dbuild
