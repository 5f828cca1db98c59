#include <cassert>
#include <iostream>
#include <string>

#include "internal/expr/evaluator.hpp"
#include "internal/expr/parser.hpp"

namespace {

using opentimeline::model::NamedTag;
using opentimeline::model::TagSet;
using opentimeline::model::ValueTag;

bool Matches(const std::string& expression, const TagSet& tags) {
  auto predicate = opentimeline::expr::Parse(expression);
  assert(predicate.has_value());
  return opentimeline::expr::Evaluate(*predicate, tags);
}

void TestEquality() {
  const TagSet tags{NamedTag("era", "ww1"), NamedTag("country", "fr"), NamedTag("country", "de")};

  assert(Matches(R"(era = "ww1")", tags));
  assert(!Matches(R"(era = "ww2")", tags));
  assert(Matches(R"(country = "de")", tags));
  assert(!Matches(R"(Era = "ww1")", tags));
}

void TestNotEqualsRequiresTheName() {
  assert(Matches(R"(era != "ww2")", {NamedTag("era", "ww1")}));
  assert(!Matches(R"(era != "ww1")", {NamedTag("era", "ww1")}));
  // present with another value as well still fails: some tag carries ww1
  assert(!Matches(R"(era != "ww1")", {NamedTag("era", "ww2"), NamedTag("era", "ww1")}));
  // absent name is not "not equal"
  assert(!Matches(R"(era != "ww1")", {NamedTag("country", "fr")}));
  assert(Matches(R"(NOT era = "ww1")", {NamedTag("country", "fr")}));
}

void TestExistence() {
  const TagSet tags{NamedTag("country", "fr"), ValueTag("person")};

  assert(Matches("country exists", tags));
  assert(!Matches("era exists", tags));
  assert(Matches("era not exists", tags));
  assert(!Matches("country not exists", tags));
}

void TestAnonymousValues() {
  const TagSet tags{ValueTag("scientist"), NamedTag("field", "physics")};

  assert(Matches(R"("scientist")", tags));
  // named tags never satisfy a bare value
  assert(!Matches(R"("physics")", tags));
  assert(!Matches(R"(scientist exists)", tags));
}

void TestBooleanCombinations() {
  const TagSet tags{NamedTag("era", "ww1"), ValueTag("battle")};

  assert(Matches(R"(era = "ww1" AND "battle")", tags));
  assert(!Matches(R"(era = "ww1" AND "treaty")", tags));
  assert(Matches(R"(era = "ww2" OR "battle")", tags));
  assert(Matches(R"(NOT (era = "ww2" OR "treaty"))", tags));
  assert(!Matches(R"(NOT "battle")", tags));
  assert(Matches(R"(("treaty" OR "battle") AND era exists AND country not exists)", tags));
}

void TestEmptyTagSet() {
  assert(!Matches("a exists", {}));
  assert(Matches("a not exists", {}));
  assert(!Matches(R"("x")", {}));
}

} // namespace

int main() {
  TestEquality();
  TestNotEqualsRequiresTheName();
  TestExistence();
  TestAnonymousValues();
  TestBooleanCombinations();
  TestEmptyTagSet();

  std::cout << "opentimeline_unit_expression_evaluator: pass\n";
  return 0;
}
