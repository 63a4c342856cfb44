#pragma once

namespace vc {

// Map a value from [dataMin, dataMax] to [outMin, outMax].
inline double normalizeToRange(double value, double dataMin, double dataMax,
                               double outMin, double outMax) {
  if (dataMax <= dataMin) return outMin;
  double t = (value - dataMin) / (dataMax - dataMin);
  return outMin + t * (outMax - outMin);
}

inline double clampValue(double v, double lo, double hi) {
  return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace vc
