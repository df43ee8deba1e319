#pragma once

#include "model.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dbuild {

// Canonical text form of configuration values: "{key1=val1,key2=val2}" with keys
// sorted, strings quoted and escaped, lists as "{a,b}". Fields holding their default
// value (empty string, empty list, absent optional, documented default) are omitted, so
// structurally equal values always produce the same text regardless of how they were
// written down.
class canonical_table {
 public:
  canonical_table &set(std::string key, std::string_view value);
  canonical_table &set_default(std::string key,
                               std::string_view value,
                               std::string_view default_value);
  canonical_table &set_raw(std::string key, std::string canonical);

  // Elements are canonical strings; set-like lists are sorted and deduplicated.
  canonical_table &set_list(std::string key, std::vector<std::string> items);
  canonical_table &set_set(std::string key, std::vector<std::string> items);

  std::string str() const;

 private:
  std::map<std::string, std::string> fields_;
};

std::string canonical_quote(std::string_view value);

std::string canonical(module_descriptor const &module);
std::string canonical(build_options const &options);
std::string canonical(project_config const &config);
std::string canonical(extraction_config const &config);
std::string canonical(repeatable_project_build const &build);

// Lowercase hex BLAKE3 of the canonical form
std::string identity_hash(std::string_view canonical_text);

template <typename T>
std::string fingerprint(T const &value) {
  return identity_hash(canonical(value));
}

// Per-project working directory under `parent`, keyed by the hash of the name only
std::string project_dir_name(std::string_view project_name);

}  // namespace dbuild
