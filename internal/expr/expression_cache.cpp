#include "internal/expr/expression_cache.hpp"

#include "internal/expr/parser.hpp"

namespace opentimeline::expr {

ExpressionCache::ExpressionCache(std::size_t capacity) : capacity_(capacity) {
}

CompiledExpression ExpressionCache::Get(const std::string& expression) {
  {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(expression);
    if (it != entries_.end()) return it->second;
  }

  // parse outside the lock; a concurrent miss on the same text is harmless
  auto parsed = Parse(expression);
  CompiledExpression compiled = parsed ? std::make_shared<const Predicate>(std::move(*parsed)) : nullptr;

  if (capacity_ == 0) return compiled;

  std::unique_lock lock(mutex_);
  auto [it, inserted] = entries_.emplace(expression, compiled);
  if (!inserted) return it->second;

  order_.push_back(expression);
  while (entries_.size() > capacity_) {
    entries_.erase(order_.front());
    order_.pop_front();
  }
  return compiled;
}

std::size_t ExpressionCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void ExpressionCache::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  order_.clear();
}

} // namespace opentimeline::expr
