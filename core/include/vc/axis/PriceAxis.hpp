#pragma once
#include "vc/axis/AxisTick.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vc {

enum class ScaleMode : std::uint8_t { Linear = 0, Log = 1 };

struct PriceAxisResult {
  std::vector<AxisTick> ticks;
  double niceMin{0};
  double niceMax{1};
  double step{1};          // 0 for log-scale ticks
  int decimals{0};
  int targetTicks{0};
  ScaleMode mode{ScaleMode::Linear};   // Linear when a log request fell back
};

// Ticks for [dataMin, dataMax] on a surface `surfaceHeight` px tall.
// Degenerate input (flat or non-finite range) yields a synthetic range.
PriceAxisResult computePriceAxis(double dataMin, double dataMax, double surfaceHeight,
                                 double minTickSpacingPx = 50.0,
                                 ScaleMode mode = ScaleMode::Linear);

// 0.001 .. 50000 in 1-2-5 steps.
const std::vector<double>& niceStepLadder();
// Psychological levels snapped to when within one step.
const std::vector<double>& keyPriceLevels();

// 3-6% of the range, scaled by range magnitude.
double pricePaddingFraction(double dataMin, double dataMax);
int decimalsForStep(double step);

bool isKeyPriceLevel(double price);
// Multiple of the next round unit above `step` (x5 for 1/2 steps, x2 for 5 steps).
bool isNiceRoundNumber(double price, double step);

// K/M compaction from 100,000 upward.
std::string formatPriceLabel(double value, int decimals);

} // namespace vc
