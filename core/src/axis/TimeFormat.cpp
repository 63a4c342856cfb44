#include "vc/axis/TimeFormat.hpp"

#include <cstdio>

namespace vc {

static std::time_t floorSeconds(TimeMs t) {
  TimeMs s = t / 1000;
  if (t % 1000 != 0 && t < 0) --s;
  return static_cast<std::time_t>(s);
}

static std::tm toTm(TimeMs t) {
  std::time_t epoch = floorSeconds(t);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &epoch);
#else
  gmtime_r(&epoch, &tm);
#endif
  return tm;
}

CivilTime toCivil(TimeMs t) {
  std::tm tm = toTm(t);
  CivilTime c;
  c.year = tm.tm_year + 1900;
  c.month = tm.tm_mon + 1;
  c.day = tm.tm_mday;
  c.hour = tm.tm_hour;
  c.minute = tm.tm_min;
  c.second = tm.tm_sec;
  c.weekday = tm.tm_wday;
  return c;
}

TimeMs fromCivil(int year, int month, int day, int hour, int minute) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = 0;
  return static_cast<TimeMs>(portableTimegm(&tm)) * 1000;
}

std::string formatTime(TimeMs t, const char* fmt) {
  std::tm tm = toTm(t);
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string formatDuration(TimeMs span) {
  if (span < 0) span = -span;
  char buf[48];
  TimeMs minutes = span / kMinuteMs;
  TimeMs hours = span / kHourMs;
  TimeMs days = span / kDayMs;
  if (hours < 1) {
    std::snprintf(buf, sizeof(buf), "%lldm", static_cast<long long>(minutes));
  } else if (days < 1) {
    long long m = static_cast<long long>(minutes % 60);
    if (m) std::snprintf(buf, sizeof(buf), "%lldh %lldm", static_cast<long long>(hours), m);
    else   std::snprintf(buf, sizeof(buf), "%lldh", static_cast<long long>(hours));
  } else if (days < 60) {
    long long h = static_cast<long long>(hours % 24);
    if (h) std::snprintf(buf, sizeof(buf), "%lldd %lldh", static_cast<long long>(days), h);
    else   std::snprintf(buf, sizeof(buf), "%lldd", static_cast<long long>(days));
  } else if (days < 365) {
    std::snprintf(buf, sizeof(buf), "%lldmo", static_cast<long long>(days / 30));
  } else {
    long long y = static_cast<long long>(days / 365);
    long long mo = static_cast<long long>((days % 365) / 30);
    if (mo) std::snprintf(buf, sizeof(buf), "%lldy %lldmo", y, mo);
    else    std::snprintf(buf, sizeof(buf), "%lldy", y);
  }
  return buf;
}

const char* weekdayName(int weekday) {
  static const char* kNames[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  if (weekday < 0 || weekday > 6) return "";
  return kNames[weekday];
}

} // namespace vc
