#pragma once

#include <optional>
#include <string>

#include "internal/model/date.hpp"
#include "internal/model/tag.hpp"

namespace opentimeline::model {

struct Entity {
  std::string                id;
  std::string                name;
  PartialDate                start;
  std::optional<PartialDate> end;

  // Throws DateError when end falls before start at their shared precision.
  void Validate() const;
};

struct Timeline {
  std::string                id;
  std::string                name;
  std::optional<std::string> bool_expression;
};

} // namespace opentimeline::model
