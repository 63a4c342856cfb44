#pragma once
#include "vc/data/PriceBar.hpp"

#include <ctime>
#include <string>

namespace vc {

// Broken-down UTC time. month is 1-12, weekday 0=Sunday.
struct CivilTime {
  int year{1970};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
  int weekday{4};
};

// Cross-platform timegm (struct tm -> epoch seconds as UTC).
inline std::time_t portableTimegm(std::tm* tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

CivilTime toCivil(TimeMs t);

// Out-of-range fields are normalized (month 13 -> January next year).
TimeMs fromCivil(int year, int month, int day, int hour = 0, int minute = 0);

// strftime in UTC.
std::string formatTime(TimeMs t, const char* fmt);

// "5m", "3h", "2d 4h", "3mo", "1y 2mo"
std::string formatDuration(TimeMs span);

// English three-letter weekday name, 0=Sunday.
const char* weekdayName(int weekday);

inline bool isWeekday(const CivilTime& c) { return c.weekday >= 1 && c.weekday <= 5; }

} // namespace vc
