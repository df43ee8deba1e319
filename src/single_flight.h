#pragma once

#include "util.h"

#include "tbb/concurrent_hash_map.h"

#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <utility>

namespace dbuild {

// Memoizes one value per key for the lifetime of the map. The first caller for a key
// runs `compute`; concurrent callers block on the same shared future, later callers
// read it. Exceptions escaping `compute` are memoized and rethrown to every caller.
template <typename Value>
class single_flight : unmovable {
 public:
  template <typename Fn>
  Value get_or_compute(std::string const &key, Fn &&compute, bool *computed = nullptr) {
    std::promise<Value> promise;
    std::shared_future<Value> future;
    bool owner{ false };

    {
      typename map_t::accessor acc;
      if (entries_.insert(acc, key)) {
        acc->second = promise.get_future().share();
        owner = true;
      }
      future = acc->second;
    }

    if (computed) { *computed = owner; }
    if (!owner) { return future.get(); }

    try {
      promise.set_value(compute());
    } catch (...) {
      promise.set_exception(std::current_exception());
    }
    return future.get();
  }

  // Completed value for `key`, if any. Does not wait for in-flight computations.
  std::optional<Value> peek(std::string const &key) const {
    typename map_t::const_accessor acc;
    if (!entries_.find(acc, key)) { return std::nullopt; }
    auto const future{ acc->second };
    acc.release();

    if (future.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready) {
      return std::nullopt;
    }
    return future.get();
  }

  std::size_t size() const { return entries_.size(); }

 private:
  using map_t = tbb::concurrent_hash_map<std::string, std::shared_future<Value>>;
  map_t entries_;
};

}  // namespace dbuild
