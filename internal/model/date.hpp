#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace opentimeline::model {

inline constexpr int32_t kMinYear = -50000;
inline constexpr int32_t kMaxYear = 10000;

class DateError : public std::invalid_argument {
 public:
  explicit DateError(const std::string& msg) : std::invalid_argument(msg) {
  }
};

enum class DatePrecision : std::uint8_t {
  kYear  = 0,
  kMonth = 1,
  kDay   = 2,
};

constexpr std::string_view ToString(DatePrecision precision) {
  switch (precision) {
    case DatePrecision::kDay:
      return "day";
    case DatePrecision::kMonth:
      return "month";
    case DatePrecision::kYear:
    default:
      return "year";
  }
}

/*
  Calendar date known to year, month or day precision.

  A missing month/day means "unknown", not "unbounded". Comparison treats a
  missing component as the earliest possible value, so 1914 < 1914-06 <
  1914-06-28. Day always implies month.
*/
class PartialDate {
 public:
  // Throws DateError on out-of-range fields or a day without a month.
  static PartialDate Make(int32_t year, std::optional<uint8_t> month = std::nullopt, std::optional<uint8_t> day = std::nullopt);

  int32_t Year() const {
    return year_;
  }
  std::optional<uint8_t> Month() const {
    return month_;
  }
  std::optional<uint8_t> Day() const {
    return day_;
  }

  DatePrecision Precision() const {
    if (day_) return DatePrecision::kDay;
    if (month_) return DatePrecision::kMonth;
    return DatePrecision::kYear;
  }

  // "28 Jun 1914", "Jun 1914", "1914"
  std::string LongFormat() const;
  // "28 / 6 / 1914", "- / 6 / 1914", "- / - / 1914"
  std::string ShortFormat() const;
  // ISO-like, precision preserving: "1914", "1914-06", "1914-06-28"
  std::string ToIsoString() const;

  friend bool operator==(const PartialDate&, const PartialDate&) = default;

 private:
  PartialDate(int32_t year, std::optional<uint8_t> month, std::optional<uint8_t> day) : year_(year), month_(month), day_(day) {
  }

  int32_t                year_;
  std::optional<uint8_t> month_;
  std::optional<uint8_t> day_;
};

// <0, 0, >0. Missing month/day sorts before any explicit value.
int Compare(const PartialDate& a, const PartialDate& b);

inline bool operator<(const PartialDate& a, const PartialDate& b) {
  return Compare(a, b) < 0;
}

} // namespace opentimeline::model
