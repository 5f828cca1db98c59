#pragma once

#include "internal/expr/predicate.hpp"
#include "internal/model/tag.hpp"

namespace opentimeline::expr {

/*
  Evaluates a predicate against one entity's tags.

  Two-valued: a missing tag name never yields "unknown".

    name = "v"      some tag `name` has value v
    name != "v"     some tag `name` exists and none has value v
                    (false when `name` is absent altogether)
    name exists     some tag `name` exists
    name not exists no tag `name` exists
    "v"             some anonymous tag has value v

  AND/OR short-circuit left to right. Pure; safe to call concurrently.
*/
bool Evaluate(const Predicate& predicate, const model::TagSet& tags);

} // namespace opentimeline::expr
