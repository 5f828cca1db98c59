#include "entity.hpp"

namespace opentimeline::model {

namespace {

// Only components known on both sides are compared; 1914-06 -> 1914 is fine.
bool EndsBeforeStart(const PartialDate& start, const PartialDate& end) {
  if (end.Year() != start.Year()) return end.Year() < start.Year();
  if (!end.Month() || !start.Month()) return false;
  if (*end.Month() != *start.Month()) return *end.Month() < *start.Month();
  if (!end.Day() || !start.Day()) return false;
  return *end.Day() < *start.Day();
}

} // namespace

void Entity::Validate() const {
  if (end && EndsBeforeStart(start, *end)) {
    throw DateError("entity '" + name + "' ends (" + end->ToIsoString() + ") before it starts (" + start.ToIsoString() + ")");
  }
}

} // namespace opentimeline::model
