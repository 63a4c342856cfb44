#include "vc/axis/PriceAxis.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace vc {

static constexpr int kMaxTickIterations = 50;

const std::vector<double>& niceStepLadder() {
  static const std::vector<double> kSteps = [] {
    std::vector<double> s;
    for (double mag = 0.001; mag < 100000.0; mag *= 10.0) {
      for (double m : {1.0, 2.0, 5.0}) {
        double v = m * mag;
        if (v > 50000.0 * 1.0001) break;
        // Strip accumulated float error from the magnitude product.
        s.push_back(std::round(v * 1e6) / 1e6);
      }
    }
    return s;
  }();
  return kSteps;
}

const std::vector<double>& keyPriceLevels() {
  static const std::vector<double> kLevels = {
    1, 5, 10, 50, 100, 500, 1000, 5000, 10000, 50000, 100000
  };
  return kLevels;
}

double pricePaddingFraction(double dataMin, double dataMax) {
  double range = dataMax - dataMin;
  double scale = std::max(std::fabs(dataMax), 100.0);
  double pct = range / scale * 0.1;
  return std::min(0.06, std::max(0.03, pct));
}

int decimalsForStep(double step) {
  if (step >= 1.0) return 0;
  if (step >= 0.1) return 1;
  if (step >= 0.01) return 2;
  if (step >= 0.001) return 3;
  return 4;
}

static bool nearlyEqual(double a, double b, double scale) {
  return std::fabs(a - b) <= 1e-9 * std::max(1.0, std::fabs(scale));
}

static bool isMultipleOf(double v, double unit) {
  if (unit <= 0) return false;
  double q = v / unit;
  return std::fabs(q - std::round(q)) < 1e-6;
}

bool isKeyPriceLevel(double price) {
  for (double k : keyPriceLevels()) {
    if (nearlyEqual(price, k, k)) return true;
  }
  return false;
}

static int leadingDigit(double step) {
  double mag = std::pow(10.0, std::floor(std::log10(step)));
  return static_cast<int>(std::round(step / mag));
}

bool isNiceRoundNumber(double price, double step) {
  if (step <= 0) return false;
  double unit = step * (leadingDigit(step) == 5 ? 2.0 : 5.0);
  return isMultipleOf(price, unit);
}

std::string formatPriceLabel(double value, int decimals) {
  char buf[48];
  double a = std::fabs(value);
  if (a >= 1.0e6) {
    std::snprintf(buf, sizeof(buf), "%.2fM", value / 1.0e6);
  } else if (a >= 1.0e5) {
    std::snprintf(buf, sizeof(buf), "%.1fK", value / 1.0e3);
  } else {
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  }
  return buf;
}

// {1, 2, 5} x 10^n nearest above `raw`, for ranges off the ladder.
static double genericNiceStep(double raw) {
  double mag = std::pow(10.0, std::floor(std::log10(raw)));
  double residual = raw / mag;
  if (residual <= 1.0) return mag;
  if (residual <= 2.0) return 2.0 * mag;
  if (residual <= 5.0) return 5.0 * mag;
  return 10.0 * mag;
}

static double chooseStep(double range, int target) {
  double ideal = range / static_cast<double>(std::max(1, target - 1));
  double best = 0;
  double bestScore = 1e300;
  for (double step : niceStepLadder()) {
    if (step < ideal * 0.5) continue;
    if (step > ideal * 3.0) break;
    double count = std::ceil(range / step);
    double score = std::fabs(count - target) + 0.5 * std::fabs(std::log10(step / ideal));
    if (score < bestScore) {
      bestScore = score;
      best = step;
    }
  }
  return best > 0 ? best : genericNiceStep(ideal);
}

static double pixelFor(double v, double lo, double hi, double height) {
  if (hi <= lo) return height;
  return height - (v - lo) / (hi - lo) * height;
}

static bool computeLogTicks(double lo, double hi, double height, int target,
                            PriceAxisResult& out) {
  if (lo <= 0 || hi / lo < 10.0) return false;

  int d0 = static_cast<int>(std::floor(std::log10(lo)));
  int d1 = static_cast<int>(std::ceil(std::log10(hi)));
  double logLo = std::log10(lo), logHi = std::log10(hi);

  // 1-2-5 per decade; only decade marks when that would crowd the axis.
  bool decadesOnly = (d1 - d0) * 3 > target * 3 / 2;
  out.ticks.clear();
  double smallest = 0;
  for (int d = d0; d <= d1; ++d) {
    double mag = std::pow(10.0, d);
    for (double m : {1.0, 2.0, 5.0}) {
      if (decadesOnly && m != 1.0) continue;
      double v = m * mag;
      if (v < lo || v > hi) continue;
      if (smallest == 0) smallest = v;
      AxisTick t;
      t.position = v;
      t.pixel = height - (std::log10(v) - logLo) / (logHi - logLo) * height;
      t.isMajor = m == 1.0;
      t.isKeyBoundary = isKeyPriceLevel(v);
      out.ticks.push_back(t);
    }
  }
  if (out.ticks.size() < 2) {
    out.ticks.clear();
    return false;
  }

  out.niceMin = lo;
  out.niceMax = hi;
  out.step = 0;
  out.decimals = decimalsForStep(smallest);
  for (auto& t : out.ticks) t.label = formatPriceLabel(t.position, out.decimals);
  out.mode = ScaleMode::Log;
  return true;
}

PriceAxisResult computePriceAxis(double dataMin, double dataMax, double surfaceHeight,
                                 double minTickSpacingPx, ScaleMode mode) {
  PriceAxisResult result;

  if (!std::isfinite(dataMin) || !std::isfinite(dataMax)) {
    dataMin = 0.0;
    dataMax = 1.0;
  }
  if (dataMin > dataMax) std::swap(dataMin, dataMax);
  if (dataMax - dataMin <= 0) {
    // Flat series: open a window of 5% (at least 1) around the price.
    double half = std::max(std::fabs(dataMax) * 0.05, 1.0);
    dataMin -= half;
    dataMax += half;
    if (dataMin < 0 && dataMax - half >= 0) dataMin = 0;
  }
  if (!(surfaceHeight > 0)) surfaceHeight = 1.0;
  if (!(minTickSpacingPx > 0)) minTickSpacingPx = 50.0;

  int maxTicks = static_cast<int>(std::floor(surfaceHeight / minTickSpacingPx));
  maxTicks = std::max(5, std::min(12, maxTicks));
  // One tick per 60 px, never fewer than six.
  int target = std::min(maxTicks, static_cast<int>(std::floor(surfaceHeight / 60.0)));
  target = std::max(6, std::min(12, target));
  result.targetTicks = target;

  double frac = pricePaddingFraction(dataMin, dataMax);
  double pad = (dataMax - dataMin) * frac;
  double lo = dataMin - pad;
  double hi = dataMax + pad;
  if (dataMin >= 0 && lo < 0) lo = 0;
  // Log scale pads multiplicatively so a positive range stays positive.
  if (mode == ScaleMode::Log && dataMin > 0) {
    lo = dataMin * (1.0 - frac);
    hi = dataMax * (1.0 + frac);
  }

  if (mode == ScaleMode::Log && computeLogTicks(lo, hi, surfaceHeight, target, result))
    return result;

  double step = chooseStep(hi - lo, target);
  double niceMin = std::floor(lo / step) * step;
  double niceMax = std::ceil(hi / step) * step;

  // Psychological levels on the step grid, within one step outside the bounds.
  for (double k : keyPriceLevels()) {
    if (!isMultipleOf(k, step)) continue;
    if (k < niceMin && k >= niceMin - step) niceMin = k;
    if (k > niceMax && k <= niceMax + step) niceMax = k;
  }
  if (dataMin >= 0 && niceMin < 0) niceMin = 0;

  result.step = step;
  result.decimals = decimalsForStep(step);
  result.niceMin = niceMin;
  result.niceMax = niceMax;

  for (int i = 0; i < kMaxTickIterations; ++i) {
    // Recomputed from the index so float error does not accumulate.
    double v = std::round((niceMin + i * step) / step) * step;
    v = std::round(v * 1e10) / 1e10;
    if (v > niceMax + step * 1e-6) break;

    AxisTick t;
    t.position = v;
    t.pixel = pixelFor(v, niceMin, niceMax, surfaceHeight);
    t.isKeyBoundary = isKeyPriceLevel(v);
    t.isMajor = t.isKeyBoundary || isNiceRoundNumber(v, step);
    t.label = formatPriceLabel(v, result.decimals);
    result.ticks.push_back(t);
  }
  return result;
}

} // namespace vc
