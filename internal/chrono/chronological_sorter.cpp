#include "internal/chrono/chronological_sorter.hpp"

#include <algorithm>

namespace opentimeline::chrono {

bool ChronologicalLess(const model::Entity& a, const model::Entity& b) {
  if (const int c = model::Compare(a.start, b.start); c != 0) {
    return c < 0;
  }
  if (a.name != b.name) {
    return a.name < b.name;
  }
  return a.id < b.id;
}

std::vector<model::Entity> SortChronologically(std::vector<model::Entity> entities) {
  std::stable_sort(entities.begin(), entities.end(), ChronologicalLess);
  return entities;
}

} // namespace opentimeline::chrono
