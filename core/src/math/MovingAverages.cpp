#include "vc/math/MovingAverages.hpp"

#include <cmath>
#include <limits>

namespace vc {

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> computeSma(const std::vector<double>& in, int period) {
  std::vector<double> out(in.size(), kNaN);
  if (period < 1) return out;
  const auto p = static_cast<std::size_t>(period);

  double sum = 0;
  std::size_t valid = 0;   // consecutive finite values ending at i
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (std::isnan(in[i])) {
      sum = 0;
      valid = 0;
      continue;
    }
    sum += in[i];
    ++valid;
    if (valid > p) {
      sum -= in[i - p];
      valid = p;
    }
    if (valid == p) out[i] = sum / static_cast<double>(p);
  }
  return out;
}

std::vector<double> computeEma(const std::vector<double>& in, int period) {
  std::vector<double> out(in.size(), kNaN);
  if (period < 1) return out;
  const auto p = static_cast<std::size_t>(period);

  std::size_t first = 0;
  while (first < in.size() && std::isnan(in[first])) ++first;
  if (in.size() - first < p) return out;

  double seed = 0;
  for (std::size_t i = first; i < first + p; ++i) seed += in[i];
  double prev = seed / static_cast<double>(p);
  out[first + p - 1] = prev;

  double k = 2.0 / (static_cast<double>(p) + 1.0);
  for (std::size_t i = first + p; i < in.size(); ++i) {
    if (std::isnan(in[i])) continue;
    prev = in[i] * k + prev * (1.0 - k);
    out[i] = prev;
  }
  return out;
}

std::vector<double> computeWma(const std::vector<double>& in, int period) {
  std::vector<double> out(in.size(), kNaN);
  if (period < 1) return out;
  const auto p = static_cast<std::size_t>(period);
  const double denom = static_cast<double>(p * (p + 1)) / 2.0;

  for (std::size_t i = p - 1; i < in.size(); ++i) {
    double sum = 0;
    bool ok = true;
    for (std::size_t j = 0; j < p; ++j) {
      double v = in[i - p + 1 + j];
      if (std::isnan(v)) { ok = false; break; }
      sum += v * static_cast<double>(j + 1);
    }
    if (ok) out[i] = sum / denom;
  }
  return out;
}

std::vector<double> computeHma(const std::vector<double>& in, int period) {
  if (period < 2) return computeWma(in, period);
  auto half = computeWma(in, period / 2);
  auto full = computeWma(in, period);

  std::vector<double> diff(in.size(), kNaN);
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (!std::isnan(half[i]) && !std::isnan(full[i])) diff[i] = 2.0 * half[i] - full[i];
  }
  int sq = static_cast<int>(std::floor(std::sqrt(static_cast<double>(period))));
  return computeWma(diff, sq < 1 ? 1 : sq);
}

std::vector<double> computeRollingStd(const std::vector<double>& in, int period) {
  std::vector<double> out(in.size(), kNaN);
  auto mean = computeSma(in, period);
  if (period < 1) return out;
  const auto p = static_cast<std::size_t>(period);

  for (std::size_t i = 0; i < in.size(); ++i) {
    if (std::isnan(mean[i])) continue;
    double acc = 0;
    for (std::size_t j = i + 1 - p; j <= i; ++j) {
      double d = in[j] - mean[i];
      acc += d * d;
    }
    out[i] = std::sqrt(acc / static_cast<double>(p));
  }
  return out;
}

std::vector<double> computeWilder(const std::vector<double>& in, int period, int first) {
  std::vector<double> out(in.size(), kNaN);
  if (period < 1 || first < 0) return out;
  const auto p = static_cast<std::size_t>(period);
  const auto f = static_cast<std::size_t>(first);
  if (in.size() < f + p) return out;

  double avg = 0;
  for (std::size_t i = f; i < f + p; ++i) avg += in[i];
  avg /= static_cast<double>(p);
  out[f + p - 1] = avg;

  for (std::size_t i = f + p; i < in.size(); ++i) {
    avg = (avg * static_cast<double>(p - 1) + in[i]) / static_cast<double>(p);
    out[i] = avg;
  }
  return out;
}

} // namespace vc
