#pragma once
#include <vector>

namespace vc {

// All series helpers return one value per input; NaN marks "no value"
// (warm-up, or a window touching a NaN input).

// Simple moving average. out[0..period-2] = NaN.
std::vector<double> computeSma(const std::vector<double>& in, int period);

// Exponential Moving Average seeded with the SMA of the first `period`
// valid values. Leading NaN inputs are skipped, so an EMA of a series
// that is itself warming up starts where that series becomes valid.
std::vector<double> computeEma(const std::vector<double>& in, int period);

// Linearly weighted moving average (weights 1..period).
std::vector<double> computeWma(const std::vector<double>& in, int period);

// Hull moving average: WMA(2*WMA(n/2) - WMA(n), sqrt(n)).
std::vector<double> computeHma(const std::vector<double>& in, int period);

// Population standard deviation over a rolling window.
std::vector<double> computeRollingStd(const std::vector<double>& in, int period);

// Wilder smoothing seeded with the mean of in[first..first+period-1].
std::vector<double> computeWilder(const std::vector<double>& in, int period, int first = 0);

} // namespace vc
