#include "vc/viewport/AutoScale.hpp"

#include <cmath>
#include <limits>

namespace vc {

bool AutoScale::computePriceRange(const PriceBar* bars, std::size_t count,
                                  double& lo, double& hi) const {
  double dMin = std::numeric_limits<double>::max();
  double dMax = std::numeric_limits<double>::lowest();
  bool found = false;

  for (std::size_t i = 0; i < count; ++i) {
    const PriceBar& b = bars[i];
    if (!std::isfinite(b.low) || !std::isfinite(b.high)) continue;
    if (b.low < dMin) dMin = b.low;
    if (b.high > dMax) dMax = b.high;
    found = true;
  }
  if (!found) return false;

  if (config_.includeZero) {
    if (dMin > 0) dMin = 0;
    if (dMax < 0) dMax = 0;
  }

  double range = dMax - dMin;
  double pad;
  if (range > 0) {
    pad = range * config_.priceMargin;
  } else {
    pad = std::fabs(dMax) * config_.priceMargin;
    if (pad <= 0) pad = 1.0;
  }

  lo = dMin - pad;
  hi = dMax + pad;
  return true;
}

bool AutoScale::computeVolumeRange(const PriceBar* bars, std::size_t count,
                                   double& lo, double& hi) const {
  if (count == 0) return false;
  double vMax = 0;
  for (std::size_t i = 0; i < count; ++i) {
    if (std::isfinite(bars[i].volume) && bars[i].volume > vMax) vMax = bars[i].volume;
  }
  lo = 0.0;
  hi = vMax > 0 ? vMax * (1.0 + config_.volumeHeadroom) : 1.0;
  return true;
}

} // namespace vc
