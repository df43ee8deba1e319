#pragma once

#include "util.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace dbuild {

// RAII wrapper for libgit2 global initialization/shutdown.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

// Project source locations:
//   nil[:anything]     no sources
//   file:<path>        local directory, copied on checkout
//   git:<url>#<ref>    git repository at a branch, tag or commit
enum class source_scheme { nil, file, git };

struct source_uri {
  source_scheme scheme;
  std::string location;  // path or git url
  std::string ref;       // git only
};

// Throws configuration_error for unknown schemes and malformed git uris
source_uri source_parse(std::string_view uri);

// Pins a uri: git refs become full commit ids, file paths become absolute. A pinned uri
// resolves to itself. Throws std::runtime_error when the source cannot be reached.
std::string source_resolve(std::string_view uri);

// Replaces `dest` with the sources of a resolved uri
void source_checkout(std::string_view uri, std::filesystem::path const &dest);

}  // namespace dbuild
