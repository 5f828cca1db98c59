#pragma once

#include <vector>

#include "internal/model/entity.hpp"

namespace opentimeline::chrono {

// Start date (missing month/day earliest), then name, then id.
bool ChronologicalLess(const model::Entity& a, const model::Entity& b);

// Stable; idempotent on already sorted input.
std::vector<model::Entity> SortChronologically(std::vector<model::Entity> entities);

} // namespace opentimeline::chrono
