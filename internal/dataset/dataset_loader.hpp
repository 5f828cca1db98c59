#pragma once

#include <cstddef>
#include <string>

#include "opentimeline/v1/types.pb.h"

namespace opentimeline::db {
class Repository;
}

namespace opentimeline::dataset {

struct ImportSummary {
  std::size_t entities  = 0;
  std::size_t timelines = 0;
  std::size_t links     = 0;
  std::size_t edges     = 0;
};

/*
  JSON import/export of whole datasets (opentimeline.v1.Dataset).

  Import runs in one repository transaction: either everything lands or
  nothing does. Entities or timelines without an id get a fresh UUID.
  Timeline references (entity_ids, subtimeline_ids) name a dataset id or,
  failing that, a dataset entity/timeline name; anything else is stored
  verbatim as a dangling reference.

  Errors:
    util::InvalidArgument  malformed JSON, invalid dates
    util::AlreadyExists    duplicate id or name
*/
class DatasetLoader {
 public:
  static opentimeline::v1::Dataset ParseJson(const std::string& json);
  static opentimeline::v1::Dataset LoadFile(const std::string& path);

  static ImportSummary Import(db::Repository& repository, const opentimeline::v1::Dataset& dataset);

  // Everything in the repository, in insertion order.
  static opentimeline::v1::Dataset Export(db::Repository& repository);
  static std::string               ToJson(const opentimeline::v1::Dataset& dataset);
};

} // namespace opentimeline::dataset
