#include "vc/axis/TimeIntervals.hpp"
#include "vc/axis/TimeFormat.hpp"

namespace vc {

// 1970-01-05 was a Monday.
static constexpr TimeMs kFirstMondayMs = 4 * kDayMs;
static constexpr TimeMs kMonthMs = 30 * kDayMs;
static constexpr TimeMs kYearMs = 365 * kDayMs;

static TimeMs floorDiv(TimeMs a, TimeMs b) {
  TimeMs q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

static int floorDivInt(int a, int b) {
  int q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

const std::vector<TimeInterval>& timeIntervalLadder() {
  static const std::vector<TimeInterval> kLadder = {
    {"1m",  IntervalUnit::Minute, 1,  kMinuteMs,      "1h"},
    {"2m",  IntervalUnit::Minute, 2,  2 * kMinuteMs,  "1h"},
    {"5m",  IntervalUnit::Minute, 5,  5 * kMinuteMs,  "1h"},
    {"10m", IntervalUnit::Minute, 10, 10 * kMinuteMs, "30m"},
    {"15m", IntervalUnit::Minute, 15, 15 * kMinuteMs, "30m"},
    {"30m", IntervalUnit::Minute, 30, 30 * kMinuteMs, "session"},
    {"1h",  IntervalUnit::Hour,   1,  kHourMs,        "session"},
    {"2h",  IntervalUnit::Hour,   2,  2 * kHourMs,    "session"},
    {"3h",  IntervalUnit::Hour,   3,  3 * kHourMs,    "session"},
    {"4h",  IntervalUnit::Hour,   4,  4 * kHourMs,    "1D"},
    {"6h",  IntervalUnit::Hour,   6,  6 * kHourMs,    "1D"},
    {"12h", IntervalUnit::Hour,   12, 12 * kHourMs,   "1D"},
    {"1D",  IntervalUnit::Day,    1,  kDayMs,         "1W"},
    {"2D",  IntervalUnit::Day,    2,  2 * kDayMs,     "1W"},
    {"3D",  IntervalUnit::Day,    3,  3 * kDayMs,     "1W"},
    {"5D",  IntervalUnit::Day,    5,  5 * kDayMs,     "1W"},
    {"1W",  IntervalUnit::Week,   1,  kWeekMs,        "1M"},
    {"2W",  IntervalUnit::Week,   2,  2 * kWeekMs,    "1M"},
    {"1M",  IntervalUnit::Month,  1,  kMonthMs,       "3M"},
    {"2M",  IntervalUnit::Month,  2,  2 * kMonthMs,   "3M"},
    {"3M",  IntervalUnit::Month,  3,  3 * kMonthMs,   "1Y"},
    {"6M",  IntervalUnit::Month,  6,  6 * kMonthMs,   "1Y"},
    {"1Y",  IntervalUnit::Year,   1,  kYearMs,        "5Y"},
    {"2Y",  IntervalUnit::Year,   2,  2 * kYearMs,    "10Y"},
    {"5Y",  IntervalUnit::Year,   5,  5 * kYearMs,    "10Y"},
    {"10Y", IntervalUnit::Year,   10, 10 * kYearMs,   "10Y"},
  };
  return kLadder;
}

const TimeInterval* findInterval(const std::string& name) {
  for (const auto& iv : timeIntervalLadder()) {
    if (iv.name == name) return &iv;
  }
  return nullptr;
}

TimeLevel levelForInterval(const TimeInterval& iv) {
  switch (iv.unit) {
    case IntervalUnit::Minute: return TimeLevel::Minute;
    case IntervalUnit::Hour:   return TimeLevel::Hour;
    case IntervalUnit::Day:
    case IntervalUnit::Week:   return TimeLevel::Day;
    case IntervalUnit::Month:  return TimeLevel::Month;
    case IntervalUnit::Year:   return TimeLevel::Year;
  }
  return TimeLevel::Day;
}

TimeMs alignToTimeBoundary(TimeMs t, const TimeInterval& iv) {
  switch (iv.unit) {
    case IntervalUnit::Minute:
    case IntervalUnit::Hour:
    case IntervalUnit::Day: {
      // All of these divide a day, or are whole days counted from the epoch.
      TimeMs step = iv.approxMs;
      return floorDiv(t, step) * step;
    }
    case IntervalUnit::Week: {
      TimeMs step = iv.count * kWeekMs;
      return kFirstMondayMs + floorDiv(t - kFirstMondayMs, step) * step;
    }
    case IntervalUnit::Month: {
      CivilTime c = toCivil(t);
      int index = c.year * 12 + (c.month - 1);
      index = floorDivInt(index, iv.count) * iv.count;
      return fromCivil(floorDivInt(index, 12), index - floorDivInt(index, 12) * 12 + 1, 1);
    }
    case IntervalUnit::Year: {
      CivilTime c = toCivil(t);
      return fromCivil(floorDivInt(c.year, iv.count) * iv.count, 1, 1);
    }
  }
  return t;
}

TimeMs addInterval(TimeMs t, const TimeInterval& iv) {
  switch (iv.unit) {
    case IntervalUnit::Minute:
    case IntervalUnit::Hour:
    case IntervalUnit::Day:
      return t + iv.approxMs;
    case IntervalUnit::Week:
      return t + iv.count * kWeekMs;
    case IntervalUnit::Month: {
      CivilTime c = toCivil(t);
      return fromCivil(c.year, c.month + iv.count, c.day, c.hour, c.minute);
    }
    case IntervalUnit::Year: {
      CivilTime c = toCivil(t);
      return fromCivil(c.year + iv.count, c.month, c.day, c.hour, c.minute);
    }
  }
  return t + iv.approxMs;
}

} // namespace vc
