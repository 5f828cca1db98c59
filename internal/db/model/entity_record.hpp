#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace opentimeline::db::model {

/*
  Row of the `entities` table.

  Dates are stored column-wise exactly as the schema has them; the
  partial-precision rules are enforced when converting to the domain model.
*/
struct EntityRecord {
  std::string id;
  std::string name;

  int32_t                start_year = 0;
  std::optional<uint8_t> start_month;
  std::optional<uint8_t> start_day;

  std::optional<int32_t> end_year;
  std::optional<uint8_t> end_month;
  std::optional<uint8_t> end_day;
};

} // namespace opentimeline::db::model
