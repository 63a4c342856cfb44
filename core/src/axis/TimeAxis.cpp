#include "vc/axis/TimeAxis.hpp"
#include "vc/axis/TimeFormat.hpp"

#include <algorithm>
#include <cmath>

namespace vc {

int targetTickCount(double width, const TimeAxisConfig& cfg) {
  int t = cfg.pixelsPerTick > 0
      ? static_cast<int>(std::floor(width / cfg.pixelsPerTick)) : cfg.maxTicks;
  return std::max(cfg.minTicks, std::min(cfg.maxTicks, t));
}

static TimeMs firstTickAtOrAfter(TimeMs start, const TimeInterval& iv) {
  TimeMs t = alignToTimeBoundary(start, iv);
  while (t < start) t = addInterval(t, iv);
  return t;
}

// Stops counting once `limit` is exceeded.
static std::size_t countTicks(TimeMs start, TimeMs end, const TimeInterval& iv,
                              std::size_t limit) {
  std::size_t n = 0;
  for (TimeMs t = firstTickAtOrAfter(start, iv); t <= end; t = addInterval(t, iv)) {
    if (++n > limit) break;
  }
  return n;
}

// Spans in this band are labelled Mon/Wed/Fri with Monday majors.
static constexpr TimeMs kWeekBandMin = 14 * kDayMs;
static constexpr TimeMs kWeekBandMax = 45 * kDayMs;

static bool inWeekBand(TimeMs duration) {
  return duration >= kWeekBandMin && duration <= kWeekBandMax;
}

// Every other day from each Monday: Mon, Wed, Fri.
static std::vector<TimeMs> weekAnchoredTimes(TimeMs start, TimeMs end) {
  std::vector<TimeMs> out;
  const TimeInterval* week = findInterval("1W");
  for (TimeMs monday = alignToTimeBoundary(start, *week); monday <= end;
       monday += kWeekMs) {
    for (int d = 0; d < 5; d += 2) {
      TimeMs t = monday + d * kDayMs;
      if (t >= start && t <= end) out.push_back(t);
    }
  }
  return out;
}

static int minuteOfDay(const CivilTime& c) { return c.hour * 60 + c.minute; }

bool isMajorTimeTick(TimeMs t, const TimeInterval& iv, const MarketSession& s) {
  CivilTime c = toCivil(t);
  int mod = minuteOfDay(c);
  const std::string& n = iv.name;

  if (n == "1m" || n == "2m" || n == "5m") return c.minute == 0;
  if (n == "10m" || n == "15m") return c.minute % 30 == 0;
  if (n == "30m") {
    return mod == s.openMinute || mod == s.breakStartMinute ||
           mod == s.breakEndMinute || mod == s.closeMinute || mod == 12 * 60;
  }
  if (n == "1h") {
    return c.minute == 0 &&
           (c.hour == s.openMinute / 60 || c.hour == 12 ||
            c.hour == s.breakEndMinute / 60 || c.hour == s.closeMinute / 60);
  }
  if (n == "2h" || n == "3h") {
    return c.minute == 0 &&
           (c.hour == s.openMinute / 60 || c.hour == s.breakEndMinute / 60 ||
            c.hour == s.closeMinute / 60);
  }
  if (n == "4h" || n == "6h" || n == "12h") return mod == 0;
  if (n == "1D" || n == "2D") return c.weekday == 1;
  if (n == "3D" || n == "5D") return c.weekday == 1 || c.day == 1 || c.day == 15;
  if (n == "1W" || n == "2W") return c.day <= 7;
  if (n == "1M" || n == "2M") return c.month == 1 || c.month == 4 ||
                                     c.month == 7 || c.month == 10;
  if (n == "3M" || n == "6M") return c.month == 1;
  if (n == "1Y") return c.year % 5 == 0;
  return c.year % 10 == 0;
}

bool isKeyTimeBoundary(TimeMs t, const TimeInterval& iv, const MarketSession& s) {
  CivilTime c = toCivil(t);
  if (iv.unit == IntervalUnit::Minute || iv.unit == IntervalUnit::Hour) {
    int mod = minuteOfDay(c);
    return mod == s.openMinute || mod == s.closeMinute;
  }
  return c.month == 1 && c.day == 1;
}

std::string formatTimeLabel(TimeMs t, TimeLevel level, bool major, TimeMs duration) {
  switch (level) {
    case TimeLevel::Minute:
    case TimeLevel::Hour:
      if (duration < kDayMs) return formatTime(t, "%H:%M");
      return formatTime(t, major ? "%m-%d %H:%M" : "%H:%M");
    case TimeLevel::Day:
      if (duration < 7 * kDayMs) {
        std::string s = formatTime(t, "%m-%d");
        if (major) {
          s += ' ';
          s += weekdayName(toCivil(t).weekday);
        }
        return s;
      }
      if (duration < 90 * kDayMs) return formatTime(t, major ? "%m-%d" : "%d");
      return formatTime(t, major ? "%Y-%m-%d" : "%m-%d");
    case TimeLevel::Month:
      if (major) return formatTime(t, "%Y-%m");
      return formatTime(t, duration < 365 * kDayMs ? "%m-%d" : "%m");
    case TimeLevel::Year:
      if (major || duration < 5 * 365 * kDayMs) return formatTime(t, "%Y");
      return formatTime(t, "'%y");
  }
  return formatTime(t, "%Y-%m-%d");
}

// Keeps all majors; minors are sampled evenly to fill up to `keep`. When the
// majors alone reach `keep`, minors are dropped, and majors beyond the band
// maximum are sampled down to `keep`.
static std::vector<AxisTick> thinTicks(const std::vector<AxisTick>& ticks,
                                       std::size_t keep, std::size_t maxTicks) {
  std::vector<AxisTick> majors, minors;
  for (const auto& t : ticks) (t.isMajor ? majors : minors).push_back(t);

  std::vector<AxisTick> out;
  if (majors.size() >= keep) {
    if (majors.size() <= maxTicks) return majors;
    for (std::size_t i = 0; i < keep; ++i) {
      out.push_back(majors[i * majors.size() / keep]);
    }
    return out;
  }

  out = majors;
  std::size_t need = keep - majors.size();
  if (need > minors.size()) need = minors.size();
  for (std::size_t i = 0; i < need; ++i) {
    out.push_back(minors[i * minors.size() / need]);
  }
  std::sort(out.begin(), out.end(),
            [](const AxisTick& a, const AxisTick& b) { return a.position < b.position; });
  return out;
}

TimeAxisResult computeTimeAxis(TimeMs start, TimeMs end, double width,
                               const TimeAxisConfig& cfg) {
  TimeAxisResult result;
  result.targetTicks = targetTickCount(width, cfg);
  if (end < start) return result;

  const auto& ladder = timeIntervalLadder();
  const auto upper = static_cast<std::size_t>(result.targetTicks);
  const auto lower = static_cast<std::size_t>(cfg.minTicks);

  // Smallest step whose count fits under the target. If that step leaves too
  // few ticks, the next finer step is used and thinned instead.
  std::size_t chosen = ladder.size() - 1;
  for (std::size_t i = 0; i < ladder.size(); ++i) {
    std::size_t n = countTicks(start, end, ladder[i], upper);
    if (n <= upper) {
      chosen = (n < lower && i > 0) ? i - 1 : i;
      break;
    }
  }

  const TimeMs duration = end - start;
  const bool weekBand = inWeekBand(duration);
  const TimeInterval& iv = weekBand ? *findInterval("2D") : ladder[chosen];
  result.granularity = iv.name;
  result.majorStep = iv.majorStep;
  result.level = levelForInterval(iv);

  std::vector<TimeMs> times;
  if (weekBand) {
    times = weekAnchoredTimes(start, end);
  } else {
    for (TimeMs t = firstTickAtOrAfter(start, iv); t <= end; t = addInterval(t, iv)) {
      times.push_back(t);
    }
  }

  std::vector<AxisTick> ticks;
  for (TimeMs t : times) {
    AxisTick tick;
    tick.position = static_cast<double>(t);
    tick.pixel = duration > 0
        ? static_cast<double>(t - start) / static_cast<double>(duration) * width : 0.0;
    tick.isMajor = isMajorTimeTick(t, iv, cfg.session);
    tick.isKeyBoundary = isKeyTimeBoundary(t, iv, cfg.session);
    ticks.push_back(tick);
  }
  result.generatedTicks = ticks.size();

  const auto maxTicks = static_cast<std::size_t>(cfg.maxTicks);
  if (static_cast<double>(ticks.size()) > 1.5 * result.targetTicks ||
      ticks.size() > maxTicks) {
    ticks = thinTicks(ticks, upper, maxTicks);
  }

  for (auto& tick : ticks) {
    tick.label = formatTimeLabel(static_cast<TimeMs>(tick.position), result.level,
                                 tick.isMajor, duration);
  }
  result.ticks = std::move(ticks);

  result.separators = computeSeparators(start, end, result.level, cfg.maxSeparators);
  for (auto& sep : result.separators) {
    sep.pixel = duration > 0
        ? static_cast<double>(sep.timestamp - start) / static_cast<double>(duration) * width
        : 0.0;
  }
  return result;
}

TimeAxisResult computeTimeAxis(const BarSeries& visibleBars, double width,
                               const TimeAxisConfig& cfg) {
  if (visibleBars.empty()) {
    TimeAxisResult empty;
    empty.targetTicks = targetTickCount(width, cfg);
    return empty;
  }
  return computeTimeAxis(visibleBars.front().timestamp, visibleBars.back().timestamp,
                         width, cfg);
}

std::vector<TimeSeparator> computeSeparators(TimeMs start, TimeMs end, TimeLevel level,
                                             std::size_t maxCount) {
  std::vector<TimeSeparator> out;
  if (end <= start) return out;

  const TimeInterval* iv = nullptr;
  switch (level) {
    case TimeLevel::Minute:
    case TimeLevel::Hour:  iv = findInterval("1D"); break;
    case TimeLevel::Day:   iv = findInterval("1M"); break;
    case TimeLevel::Month: iv = findInterval("3M"); break;
    case TimeLevel::Year:  iv = findInterval("10Y"); break;
  }
  if (!iv) return out;

  for (TimeMs t = firstTickAtOrAfter(start, *iv); t <= end && out.size() < maxCount;
       t = addInterval(t, *iv)) {
    if (t == start) continue;   // the window edge is not a boundary crossing
    TimeSeparator sep;
    sep.timestamp = t;
    switch (level) {
      case TimeLevel::Minute:
      case TimeLevel::Hour:
        sep.type = SeparatorType::Day;
        sep.label = formatTime(t, "%m-%d");
        break;
      case TimeLevel::Day:
        sep.type = toCivil(t).month == 1 ? SeparatorType::Year : SeparatorType::Month;
        sep.label = formatTime(t, "%Y-%m");
        break;
      case TimeLevel::Month: {
        CivilTime c = toCivil(t);
        if (c.month == 1) {
          sep.type = SeparatorType::Year;
          sep.label = formatTime(t, "%Y");
        } else {
          sep.type = SeparatorType::Quarter;
          sep.label = "Q" + std::to_string((c.month - 1) / 3 + 1);
        }
        break;
      }
      case TimeLevel::Year:
        sep.type = SeparatorType::Decade;
        sep.label = formatTime(t, "%Y");
        break;
    }
    out.push_back(sep);
  }
  return out;
}

} // namespace vc
