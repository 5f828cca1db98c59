#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/expr/predicate.hpp"

namespace opentimeline::expr {

// nullptr: the expression was empty and matches nothing
using CompiledExpression = std::shared_ptr<const Predicate>;

/*
  Expression string -> compiled predicate.

  Thread-safe. Holds at most `capacity` entries and evicts the oldest
  insertion first; capacity 0 disables caching. Parse failures are
  rethrown and never cached, so fixing a timeline's expression takes
  effect on the next render.
*/
class ExpressionCache {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit ExpressionCache(std::size_t capacity = kDefaultCapacity);

  // Throws util::ParseError.
  CompiledExpression Get(const std::string& expression);

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

  void Clear();

 private:
  std::size_t capacity_;

  mutable std::shared_mutex                           mutex_;
  std::unordered_map<std::string, CompiledExpression> entries_;
  std::deque<std::string>                             order_;
};

} // namespace opentimeline::expr
