#include "date.hpp"

#include <array>

namespace opentimeline::model {

namespace {

constexpr std::array<const char*, 12> kMonthAbbrev = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Missing components compare as 0, i.e. before every valid month/day.
int CompareComponent(std::optional<uint8_t> a, std::optional<uint8_t> b) {
  const int lhs = a ? *a : 0;
  const int rhs = b ? *b : 0;
  return lhs - rhs;
}

std::string Pad2(int value) {
  return value < 10 ? "0" + std::to_string(value) : std::to_string(value);
}

} // namespace

PartialDate PartialDate::Make(int32_t year, std::optional<uint8_t> month, std::optional<uint8_t> day) {
  if (year < kMinYear || year > kMaxYear) {
    throw DateError("year " + std::to_string(year) + " is outside [" + std::to_string(kMinYear) + ", " + std::to_string(kMaxYear) + "]");
  }
  if (month && (*month < 1 || *month > 12)) {
    throw DateError("month " + std::to_string(*month) + " is not allowed");
  }
  if (day && (*day < 1 || *day > 31)) {
    throw DateError("day " + std::to_string(*day) + " is not allowed");
  }
  if (day && !month) {
    throw DateError("day set without month");
  }
  return PartialDate(year, month, day);
}

std::string PartialDate::LongFormat() const {
  std::string out;
  if (day_) {
    out += std::to_string(*day_) + " ";
  }
  if (month_) {
    out += std::string(kMonthAbbrev[*month_ - 1]) + " ";
  }
  out += std::to_string(year_);
  return out;
}

std::string PartialDate::ShortFormat() const {
  const std::string day   = day_ ? std::to_string(*day_) : "-";
  const std::string month = month_ ? std::to_string(*month_) : "-";
  return day + " / " + month + " / " + std::to_string(year_);
}

std::string PartialDate::ToIsoString() const {
  std::string out = std::to_string(year_);
  if (month_) out += "-" + Pad2(*month_);
  if (day_) out += "-" + Pad2(*day_);
  return out;
}

int Compare(const PartialDate& a, const PartialDate& b) {
  if (a.Year() != b.Year()) {
    return a.Year() < b.Year() ? -1 : 1;
  }
  if (int c = CompareComponent(a.Month(), b.Month()); c != 0) {
    return c < 0 ? -1 : 1;
  }
  if (int c = CompareComponent(a.Day(), b.Day()); c != 0) {
    return c < 0 ? -1 : 1;
  }
  return 0;
}

} // namespace opentimeline::model
