#pragma once
#include "vc/data/PriceBar.hpp"

#include <string>
#include <vector>

namespace vc {

// Technical indicator math over bar series. Every output has one value per
// input bar; NaN marks bars inside the warm-up window.

enum class PriceSource { Open, High, Low, Close, HL2, HLC3, OHLC4, Volume };

// "close", "open", "high", "low", "hl2", "hlc3", "ohlc4", "volume".
bool parsePriceSource(const std::string& name, PriceSource& out);
std::vector<double> extractSource(const BarSeries& bars, PriceSource src);

// RSI with Wilder smoothing. First `period` values are NaN.
// Zero average loss reads as the neutral midpoint 50.
std::vector<double> computeRsi(const std::vector<double>& closes, int period = 14);

struct MacdSeries {
  std::vector<double> macd, signal, histogram;
};
MacdSeries computeMacd(const std::vector<double>& closes, int fast = 12, int slow = 26,
                       int signal = 9);

struct BandSeries {
  std::vector<double> upper, middle, lower;
};
BandSeries computeBollinger(const std::vector<double>& closes, int period = 20,
                            double stdDevs = 2.0);
BandSeries computeKeltner(const BarSeries& bars, int emaPeriod = 20, int atrPeriod = 10,
                          double multiplier = 2.0);
BandSeries computeDonchian(const BarSeries& bars, int period = 20);

// %K and %D. A flat window (high == low) reads 50.
struct StochasticSeries {
  std::vector<double> k, d;
};
StochasticSeries computeStochastic(const BarSeries& bars, int kPeriod = 14, int dPeriod = 3);

struct KdjSeries {
  std::vector<double> k, d, j;
};
// K/D start from 50 and are smoothed with factor 1/smooth.
KdjSeries computeKdj(const BarSeries& bars, int period = 9, int smooth = 3);

// Flat window reads -50.
std::vector<double> computeWilliamsR(const BarSeries& bars, int period = 14);
// Zero mean deviation reads 0.
std::vector<double> computeCci(const BarSeries& bars, int period = 20);
// Non-positive reference price reads 0.
std::vector<double> computeRoc(const std::vector<double>& closes, int period = 10);
std::vector<double> computeMomentum(const std::vector<double>& closes, int period = 10);

std::vector<double> computeTrueRange(const BarSeries& bars);
std::vector<double> computeAtr(const BarSeries& bars, int period = 14);

struct DirectionalSeries {
  std::vector<double> plusDi, minusDi, adx;
};
DirectionalSeries computeDirectional(const BarSeries& bars, int period = 14);

struct SarSeries {
  std::vector<double> sar, trend;   // trend: +1 rising, -1 falling
};
SarSeries computeParabolicSar(const BarSeries& bars, double step = 0.02, double maxStep = 0.2);

std::vector<double> computeObv(const BarSeries& bars);
// Cumulative VWAP; zero cumulative volume falls back to the typical price.
std::vector<double> computeVwap(const BarSeries& bars);
// No negative flow reads 100; no flow at all reads 50.
std::vector<double> computeMfi(const BarSeries& bars, int period = 14);
// Accumulation/distribution; a bar with high == low has CLV 0.
std::vector<double> computeAccumDist(const BarSeries& bars);
std::vector<double> computeChaikin(const BarSeries& bars, int fast = 3, int slow = 10);

struct AroonSeries {
  std::vector<double> up, down, oscillator;
};
AroonSeries computeAroon(const BarSeries& bars, int period = 14);

// Rate of change of a triple EMA, scaled by 10000.
std::vector<double> computeTrix(const std::vector<double>& closes, int period = 14);

// A window with zero true range contributes 0.5.
std::vector<double> computeUltimateOscillator(const BarSeries& bars, int shortP = 7,
                                              int midP = 14, int longP = 28);

struct VolumeProfileSeries {
  std::vector<double> bin;        // bin index of the bar's typical price
  std::vector<double> binVolume;  // total volume of that bin
  std::vector<double> binPrice;   // bin centre price
  std::vector<double> profile;    // volume per bin
  double priceMin{0}, priceMax{0};
};
VolumeProfileSeries computeVolumeProfile(const BarSeries& bars, int bins = 24);

} // namespace vc
