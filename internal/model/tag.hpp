#pragma once

#include <optional>
#include <string>
#include <vector>

namespace opentimeline::model {

/*
  (name, value) annotation. name is absent for anonymous value tags.
  Multiple tags with the same name are allowed.
*/
struct Tag {
  std::optional<std::string> name;
  std::string                value;

  friend bool operator==(const Tag&, const Tag&) = default;
};

// Flat multiset: duplicates and anonymous tags are valid data.
using TagSet = std::vector<Tag>;

inline Tag NamedTag(std::string name, std::string value) {
  return Tag{std::move(name), std::move(value)};
}

inline Tag ValueTag(std::string value) {
  return Tag{std::nullopt, std::move(value)};
}

} // namespace opentimeline::model
