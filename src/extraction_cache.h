#pragma once

#include "build_system.h"
#include "outcome.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

namespace dbuild {

// Memoizes dependency extraction per extraction-config fingerprint for one run
class extraction_cache : unmovable {
 public:
  extraction_cache();
  ~extraction_cache();

  // Returns extraction_ok or extraction_failed. The extraction runs at most once per
  // fingerprint; failures are data, internal errors propagate.
  build_outcome extract(extraction_config const &config,
                        std::filesystem::path const &dir,
                        build_env const &env);

  // Previously completed successful extraction of `config`, if any
  std::optional<extraction_ok> cached(extraction_config const &config) const;

  std::size_t computations() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace dbuild
