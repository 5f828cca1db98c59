#include <cassert>
#include <iostream>

#include "internal/model/date.hpp"
#include "internal/model/entity.hpp"

namespace {

using opentimeline::model::Compare;
using opentimeline::model::DateError;
using opentimeline::model::DatePrecision;
using opentimeline::model::Entity;
using opentimeline::model::PartialDate;

template <typename Fn>
bool ThrowsDateError(Fn&& fn) {
  try {
    fn();
  } catch (const DateError&) {
    return true;
  }
  return false;
}

void TestMissingComponentsSortFirst() {
  const auto year  = PartialDate::Make(1914);
  const auto month = PartialDate::Make(1914, 6);
  const auto day   = PartialDate::Make(1914, 6, 28);

  assert(year < month);
  assert(month < day);
  assert(year < day);
  assert(Compare(day, day) == 0);
  assert(PartialDate::Make(1913, 12, 31) < year);
  assert(PartialDate::Make(-500) < PartialDate::Make(1));
}

void TestPrecision() {
  assert(PartialDate::Make(1914).Precision() == DatePrecision::kYear);
  assert(PartialDate::Make(1914, 6).Precision() == DatePrecision::kMonth);
  assert(PartialDate::Make(1914, 6, 28).Precision() == DatePrecision::kDay);
}

void TestInvalidDatesRejected() {
  assert(ThrowsDateError([] { (void)PartialDate::Make(1914, std::nullopt, 3); }));
  assert(ThrowsDateError([] { (void)PartialDate::Make(1914, 13); }));
  assert(ThrowsDateError([] { (void)PartialDate::Make(1914, 0); }));
  assert(ThrowsDateError([] { (void)PartialDate::Make(1914, 2, 32); }));
  assert(ThrowsDateError([] { (void)PartialDate::Make(20000); }));
}

void TestFormatting() {
  const auto day = PartialDate::Make(1914, 6, 28);
  assert(day.LongFormat() == "28 Jun 1914");
  assert(day.ShortFormat() == "28 / 6 / 1914");
  assert(day.ToIsoString() == "1914-06-28");

  const auto month = PartialDate::Make(1918, 11);
  assert(month.LongFormat() == "Nov 1918");
  assert(month.ShortFormat() == "- / 11 / 1918");
  assert(month.ToIsoString() == "1918-11");

  assert(PartialDate::Make(1066).ShortFormat() == "- / - / 1066");
}

void TestEntityEndBeforeStart() {
  Entity ok{.id = "a", .name = "war", .start = PartialDate::Make(1914), .end = PartialDate::Make(1914)};
  ok.Validate();

  Entity bad{.id = "b", .name = "backwards", .start = PartialDate::Make(1918), .end = PartialDate::Make(1914)};
  assert(ThrowsDateError([&] { bad.Validate(); }));
}

void TestEntityEndComparedAtSharedPrecision() {
  Entity month_to_year{.id = "c", .name = "assassination", .start = PartialDate::Make(1914, 6), .end = PartialDate::Make(1914)};
  month_to_year.Validate();

  Entity day_to_month{.id = "d", .name = "sarajevo", .start = PartialDate::Make(1914, 6, 28), .end = PartialDate::Make(1914, 6)};
  day_to_month.Validate();

  Entity year_to_day{.id = "e", .name = "armistice", .start = PartialDate::Make(1918), .end = PartialDate::Make(1918, 1, 1)};
  year_to_day.Validate();

  Entity earlier_year{.id = "f", .name = "before", .start = PartialDate::Make(1914, 6), .end = PartialDate::Make(1913)};
  assert(ThrowsDateError([&] { earlier_year.Validate(); }));

  Entity earlier_day{.id = "g", .name = "same month", .start = PartialDate::Make(1914, 6, 28), .end = PartialDate::Make(1914, 6, 27)};
  assert(ThrowsDateError([&] { earlier_day.Validate(); }));
}

} // namespace

int main() {
  TestMissingComponentsSortFirst();
  TestPrecision();
  TestInvalidDatesRejected();
  TestFormatting();
  TestEntityEndBeforeStart();
  TestEntityEndComparedAtSharedPrecision();

  std::cout << "opentimeline_unit_date: pass\n";
  return 0;
}
