// D5.1: indicator math (warm-up alignment, reference values, degenerate fallbacks)

#include "vc/data/PriceBar.hpp"
#include "vc/math/Indicators.hpp"
#include "vc/math/MovingAverages.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static vc::BarSeries makeBars(int count) {
  vc::BarSeries bars;
  for (int i = 0; i < count; ++i) {
    vc::PriceBar b;
    b.timestamp = i * vc::kDayMs;
    b.open = 100.0 + std::sin(i * 0.3) * 5.0 + i * 0.1;
    b.close = b.open + std::cos(i * 0.7) * 2.0;
    b.high = std::fmax(b.open, b.close) + 1.0 + (i % 3) * 0.25;
    b.low = std::fmin(b.open, b.close) - 1.0 - (i % 4) * 0.25;
    b.volume = 1000.0 + (i % 7) * 150.0;
    bars.push_back(b);
  }
  return bars;
}

static vc::BarSeries flatBars(int count, double price, double volume) {
  vc::BarSeries bars;
  for (int i = 0; i < count; ++i) {
    vc::PriceBar b;
    b.timestamp = i * vc::kDayMs;
    b.open = b.high = b.low = b.close = price;
    b.volume = volume;
    bars.push_back(b);
  }
  return bars;
}

static int firstValid(const std::vector<double>& v) {
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (!std::isnan(v[i])) return static_cast<int>(i);
  }
  return -1;
}

int main() {
  using namespace vc;
  const BarSeries bars = makeBars(120);
  const std::vector<double> closes = extractSource(bars, PriceSource::Close);

  // ---- Test 1: SMA warm-up and values ----
  {
    std::vector<double> in(30);
    for (int i = 0; i < 30; ++i) in[static_cast<std::size_t>(i)] = 10.0 + i * 1.5;
    auto sma = computeSma(in, 20);
    requireTrue(sma.size() == 30, "one value per input");
    for (int i = 0; i < 19; ++i) requireTrue(std::isnan(sma[static_cast<std::size_t>(i)]), "warm-up");
    double mean0 = 0, mean1 = 0;
    for (int i = 0; i < 20; ++i) mean0 += in[static_cast<std::size_t>(i)];
    for (int i = 1; i < 21; ++i) mean1 += in[static_cast<std::size_t>(i)];
    requireClose(sma[19], mean0 / 20.0, 1e-12, "first window");
    requireClose(sma[20], mean1 / 20.0, 1e-12, "second window");
    requireTrue(firstValid(computeSma(in, 31)) == -1, "period longer than input");
    requireTrue(firstValid(computeSma(in, 0)) == -1, "invalid period");
    std::printf("  Test 1 (SMA): PASS\n");
  }

  // ---- Test 2: EMA, WMA, HMA ----
  {
    std::vector<double> in = {1, 2, 3, 4, 5, 6};
    auto ema = computeEma(in, 3);
    requireTrue(std::isnan(ema[1]), "EMA warm-up");
    requireClose(ema[2], 2.0, 1e-12, "EMA seeded with the SMA");
    requireClose(ema[3], 3.0, 1e-12, "EMA step (k = 0.5)");

    auto wma = computeWma(in, 3);
    requireClose(wma[2], (1 * 1 + 2 * 2 + 3 * 3) / 6.0, 1e-12, "WMA weights 1..n");

    // EMA of a warming-up series starts where that series becomes valid.
    auto chained = computeEma(computeSma(in, 2), 2);
    requireTrue(firstValid(chained) == 2, "chained EMA skips leading NaN");

    auto hma = computeHma(closes, 16);
    requireTrue(hma.size() == closes.size(), "HMA length");
    requireTrue(firstValid(hma) == 15 + 3, "HMA warm-up = n-1 + sqrt(n)-1");
    std::printf("  Test 2 (EMA/WMA/HMA): PASS\n");
  }

  // ---- Test 3: every series is aligned with its input ----
  {
    const std::size_t n = bars.size();
    requireTrue(computeRsi(closes).size() == n, "RSI");
    MacdSeries macd = computeMacd(closes);
    requireTrue(macd.macd.size() == n && macd.signal.size() == n && macd.histogram.size() == n,
                "MACD");
    requireTrue(firstValid(macd.macd) == 25, "MACD valid from the slow EMA");
    requireTrue(firstValid(macd.signal) == 25 + 8, "signal after its own warm-up");
    BandSeries boll = computeBollinger(closes);
    requireTrue(boll.upper.size() == n && firstValid(boll.middle) == 19, "Bollinger");
    for (std::size_t i = 19; i < n; ++i) {
      requireTrue(boll.upper[i] >= boll.middle[i] && boll.middle[i] >= boll.lower[i],
                  "bands ordered");
    }
    requireTrue(computeKeltner(bars).upper.size() == n, "Keltner");
    requireTrue(computeDonchian(bars).upper.size() == n, "Donchian");
    requireTrue(computeStochastic(bars).d.size() == n, "stochastic");
    requireTrue(computeKdj(bars).j.size() == n, "KDJ");
    requireTrue(computeWilliamsR(bars).size() == n, "Williams");
    requireTrue(computeCci(bars).size() == n, "CCI");
    requireTrue(computeAtr(bars).size() == n, "ATR");
    DirectionalSeries dmi = computeDirectional(bars);
    requireTrue(dmi.adx.size() == n && firstValid(dmi.plusDi) == 14, "DMI");
    requireTrue(firstValid(dmi.adx) == 27, "ADX after two smoothing windows");
    requireTrue(computeParabolicSar(bars).sar.size() == n, "SAR");
    requireTrue(computeObv(bars).size() == n, "OBV");
    requireTrue(computeMfi(bars).size() == n, "MFI");
    requireTrue(computeChaikin(bars).size() == n, "Chaikin");
    requireTrue(computeAroon(bars).oscillator.size() == n, "Aroon");
    requireTrue(computeTrix(closes).size() == n, "TRIX");
    requireTrue(computeUltimateOscillator(bars).size() == n, "UO");
    requireTrue(computeVolumeProfile(bars).bin.size() == n, "volume profile");
    requireTrue(computeRsi(std::vector<double>{}).empty(), "empty input");
    std::printf("  Test 3 (alignment): PASS\n");
  }

  // ---- Test 4: bounded oscillators stay in range ----
  {
    auto rsi = computeRsi(closes);
    requireTrue(firstValid(rsi) == 14, "RSI warm-up");
    StochasticSeries st = computeStochastic(bars);
    auto wr = computeWilliamsR(bars);
    auto mfi = computeMfi(bars);
    AroonSeries ar = computeAroon(bars);
    auto uo = computeUltimateOscillator(bars);
    for (std::size_t i = 0; i < bars.size(); ++i) {
      if (!std::isnan(rsi[i])) requireTrue(rsi[i] >= 0 && rsi[i] <= 100, "RSI range");
      if (!std::isnan(st.k[i])) requireTrue(st.k[i] >= 0 && st.k[i] <= 100, "%K range");
      if (!std::isnan(wr[i])) requireTrue(wr[i] >= -100 && wr[i] <= 0, "%R range");
      if (!std::isnan(mfi[i])) requireTrue(mfi[i] >= 0 && mfi[i] <= 100, "MFI range");
      if (!std::isnan(ar.up[i])) requireTrue(ar.up[i] >= 0 && ar.up[i] <= 100, "Aroon range");
      if (!std::isnan(uo[i])) requireTrue(uo[i] >= 0 && uo[i] <= 100, "UO range");
    }
    std::printf("  Test 4 (ranges): PASS\n");
  }

  // ---- Test 5: degenerate windows read their neutral values ----
  {
    BarSeries flat = flatBars(40, 50.0, 1000.0);
    std::vector<double> flatCloses(40, 50.0);
    requireClose(computeRsi(flatCloses).back(), 50.0, 1e-12, "RSI without losses or gains");
    requireClose(computeStochastic(flat).k.back(), 50.0, 1e-12, "flat %K");
    requireClose(computeWilliamsR(flat).back(), -50.0, 1e-12, "flat %R");
    requireClose(computeCci(flat).back(), 0.0, 1e-12, "flat CCI");
    requireClose(computeMfi(flat).back(), 50.0, 1e-12, "MFI without flow");
    requireClose(computeKdj(flat).k.back(), 50.0, 1e-12, "flat KDJ");
    requireClose(computeUltimateOscillator(flat).back(), 50.0, 1e-12, "flat UO");
    requireClose(computeAccumDist(flat).back(), 0.0, 1e-12, "flat A/D");

    BarSeries noVolume = flatBars(5, 20.0, 0.0);
    requireClose(computeVwap(noVolume).back(), 20.0, 1e-12, "VWAP falls back to typical price");

    std::vector<double> zeroRef = {0, 1, 2, 3};
    requireClose(computeRoc(zeroRef, 1)[1], 0.0, 1e-12, "ROC with zero reference");

    std::vector<double> rising(30);
    for (std::size_t i = 0; i < rising.size(); ++i) rising[i] = 10.0 + static_cast<double>(i);
    requireClose(computeRsi(rising).back(), 50.0, 1e-12, "RSI with zero average loss");

    VolumeProfileSeries vp = computeVolumeProfile(flat, 24);
    requireTrue(vp.profile.size() == 1, "flat profile collapses to one bin");
    requireClose(vp.binVolume[0], 40000.0, 1e-9, "all volume in that bin");
    std::printf("  Test 5 (degenerate): PASS\n");
  }

  // ---- Test 6: reference values ----
  {
    BarSeries b = flatBars(3, 10.0, 100.0);
    b[1].close = 12.0; b[1].high = 12.0;
    b[2].close = 11.0; b[2].low = 11.0; b[2].high = 12.0;
    auto obv = computeObv(b);
    requireClose(obv[0], 0, 1e-12, "OBV starts at 0");
    requireClose(obv[1], 100, 1e-12, "up bar adds volume");
    requireClose(obv[2], 0, 1e-12, "down bar subtracts volume");

    std::vector<double> in = {10, 11, 12, 13, 14, 15};
    requireClose(computeMomentum(in, 2)[5], 2.0, 1e-12, "momentum");
    requireClose(computeRoc(in, 5)[5], 50.0, 1e-12, "ROC percent");

    VolumeProfileSeries vp = computeVolumeProfile(bars, 10);
    double total = 0, expected = 0;
    for (double v : vp.profile) total += v;
    for (const auto& bar : bars) expected += bar.volume;
    requireClose(total, expected, 1e-6, "profile conserves volume");
    for (std::size_t i = 0; i < bars.size(); ++i) {
      requireTrue(vp.bin[i] >= 0 && vp.bin[i] < 10, "bin index in range");
      requireTrue(vp.binPrice[i] >= vp.priceMin && vp.binPrice[i] <= vp.priceMax, "bin price");
    }

    SarSeries sar = computeParabolicSar(bars);
    for (std::size_t i = 1; i < bars.size(); ++i) {
      requireTrue(sar.trend[i] == 1.0 || sar.trend[i] == -1.0, "trend is signed");
    }

    PriceSource src;
    requireTrue(parsePriceSource("hlc3", src) && src == PriceSource::HLC3, "hlc3");
    requireTrue(!parsePriceSource("median", src), "unknown source");
    requireClose(extractSource(b, PriceSource::HL2)[2], 11.5, 1e-12, "hl2");
    std::printf("  Test 6 (reference values): PASS\n");
  }

  std::printf("D5.1 indicator math: ALL PASS\n");
  return 0;
}
