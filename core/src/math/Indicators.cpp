#include "vc/math/Indicators.hpp"
#include "vc/math/MovingAverages.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace vc {

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

static std::size_t sz(int v) { return v > 0 ? static_cast<std::size_t>(v) : 0; }

bool parsePriceSource(const std::string& name, PriceSource& out) {
  if (name == "close")  { out = PriceSource::Close;  return true; }
  if (name == "open")   { out = PriceSource::Open;   return true; }
  if (name == "high")   { out = PriceSource::High;   return true; }
  if (name == "low")    { out = PriceSource::Low;    return true; }
  if (name == "hl2")    { out = PriceSource::HL2;    return true; }
  if (name == "hlc3")   { out = PriceSource::HLC3;   return true; }
  if (name == "ohlc4")  { out = PriceSource::OHLC4;  return true; }
  if (name == "volume") { out = PriceSource::Volume; return true; }
  return false;
}

std::vector<double> extractSource(const BarSeries& bars, PriceSource src) {
  std::vector<double> out;
  out.reserve(bars.size());
  for (const auto& b : bars) {
    switch (src) {
      case PriceSource::Open:   out.push_back(b.open); break;
      case PriceSource::High:   out.push_back(b.high); break;
      case PriceSource::Low:    out.push_back(b.low); break;
      case PriceSource::Close:  out.push_back(b.close); break;
      case PriceSource::HL2:    out.push_back((b.high + b.low) / 2.0); break;
      case PriceSource::HLC3:   out.push_back((b.high + b.low + b.close) / 3.0); break;
      case PriceSource::OHLC4:  out.push_back((b.open + b.high + b.low + b.close) / 4.0); break;
      case PriceSource::Volume: out.push_back(b.volume); break;
    }
  }
  return out;
}

static double typicalPrice(const PriceBar& b) { return (b.high + b.low + b.close) / 3.0; }

// Highest high / lowest low over bars[i-period+1 .. i].
static void windowExtremes(const BarSeries& bars, std::size_t i, std::size_t period,
                           double& hh, double& ll) {
  hh = bars[i].high;
  ll = bars[i].low;
  for (std::size_t j = i + 1 - period; j < i; ++j) {
    hh = std::max(hh, bars[j].high);
    ll = std::min(ll, bars[j].low);
  }
}

static double rsiFrom(double avgGain, double avgLoss) {
  if (avgLoss == 0.0) return 50.0;
  double rs = avgGain / avgLoss;
  return 100.0 - 100.0 / (1.0 + rs);
}

std::vector<double> computeRsi(const std::vector<double>& closes, int period) {
  std::vector<double> rsi(closes.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1 || closes.size() < p + 1) return rsi;

  // First pass: initial average gain/loss
  double avgGain = 0.0, avgLoss = 0.0;
  for (std::size_t i = 1; i <= p; ++i) {
    double change = closes[i] - closes[i - 1];
    if (change > 0) avgGain += change;
    else avgLoss -= change;
  }
  avgGain /= static_cast<double>(p);
  avgLoss /= static_cast<double>(p);
  rsi[p] = rsiFrom(avgGain, avgLoss);

  // Subsequent values: Wilder's smoothing
  const double n = static_cast<double>(p);
  for (std::size_t i = p + 1; i < closes.size(); ++i) {
    double change = closes[i] - closes[i - 1];
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;
    avgGain = (avgGain * (n - 1.0) + gain) / n;
    avgLoss = (avgLoss * (n - 1.0) + loss) / n;
    rsi[i] = rsiFrom(avgGain, avgLoss);
  }
  return rsi;
}

MacdSeries computeMacd(const std::vector<double>& closes, int fast, int slow, int signal) {
  MacdSeries r;
  auto emaFast = computeEma(closes, fast);
  auto emaSlow = computeEma(closes, slow);

  r.macd.assign(closes.size(), kNaN);
  for (std::size_t i = 0; i < closes.size(); ++i) {
    if (!std::isnan(emaFast[i]) && !std::isnan(emaSlow[i])) r.macd[i] = emaFast[i] - emaSlow[i];
  }
  r.signal = computeEma(r.macd, signal);
  r.histogram.assign(closes.size(), kNaN);
  for (std::size_t i = 0; i < closes.size(); ++i) {
    if (!std::isnan(r.macd[i]) && !std::isnan(r.signal[i]))
      r.histogram[i] = r.macd[i] - r.signal[i];
  }
  return r;
}

BandSeries computeBollinger(const std::vector<double>& closes, int period, double stdDevs) {
  BandSeries r;
  r.middle = computeSma(closes, period);
  auto sd = computeRollingStd(closes, period);
  r.upper.assign(closes.size(), kNaN);
  r.lower.assign(closes.size(), kNaN);
  for (std::size_t i = 0; i < closes.size(); ++i) {
    if (std::isnan(r.middle[i])) continue;
    r.upper[i] = r.middle[i] + stdDevs * sd[i];
    r.lower[i] = r.middle[i] - stdDevs * sd[i];
  }
  return r;
}

BandSeries computeKeltner(const BarSeries& bars, int emaPeriod, int atrPeriod,
                          double multiplier) {
  BandSeries r;
  r.middle = computeEma(extractSource(bars, PriceSource::Close), emaPeriod);
  auto atr = computeAtr(bars, atrPeriod);
  r.upper.assign(bars.size(), kNaN);
  r.lower.assign(bars.size(), kNaN);
  for (std::size_t i = 0; i < bars.size(); ++i) {
    if (std::isnan(r.middle[i]) || std::isnan(atr[i])) {
      r.middle[i] = kNaN;
      continue;
    }
    r.upper[i] = r.middle[i] + multiplier * atr[i];
    r.lower[i] = r.middle[i] - multiplier * atr[i];
  }
  return r;
}

BandSeries computeDonchian(const BarSeries& bars, int period) {
  BandSeries r;
  r.upper.assign(bars.size(), kNaN);
  r.middle.assign(bars.size(), kNaN);
  r.lower.assign(bars.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return r;
  for (std::size_t i = p - 1; i < bars.size(); ++i) {
    double hh, ll;
    windowExtremes(bars, i, p, hh, ll);
    r.upper[i] = hh;
    r.lower[i] = ll;
    r.middle[i] = (hh + ll) / 2.0;
  }
  return r;
}

StochasticSeries computeStochastic(const BarSeries& bars, int kPeriod, int dPeriod) {
  StochasticSeries r;
  r.k.assign(bars.size(), kNaN);
  const std::size_t p = sz(kPeriod);
  if (p < 1) {
    r.d = r.k;
    return r;
  }

  // %K: (close - lowestLow) / (highestHigh - lowestLow) * 100
  for (std::size_t i = p - 1; i < bars.size(); ++i) {
    double hh, ll;
    windowExtremes(bars, i, p, hh, ll);
    double range = hh - ll;
    r.k[i] = range > 0.0 ? (bars[i].close - ll) / range * 100.0 : 50.0;
  }
  // %D: simple moving average of %K
  r.d = computeSma(r.k, dPeriod);
  return r;
}

KdjSeries computeKdj(const BarSeries& bars, int period, int smooth) {
  KdjSeries r;
  r.k.assign(bars.size(), kNaN);
  r.d.assign(bars.size(), kNaN);
  r.j.assign(bars.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1 || smooth < 1) return r;

  const double a = 1.0 / static_cast<double>(smooth);
  double k = 50.0, d = 50.0;
  for (std::size_t i = p - 1; i < bars.size(); ++i) {
    double hh, ll;
    windowExtremes(bars, i, p, hh, ll);
    double rsv = hh > ll ? (bars[i].close - ll) / (hh - ll) * 100.0 : 50.0;
    k = (1.0 - a) * k + a * rsv;
    d = (1.0 - a) * d + a * k;
    r.k[i] = k;
    r.d[i] = d;
    r.j[i] = 3.0 * k - 2.0 * d;
  }
  return r;
}

std::vector<double> computeWilliamsR(const BarSeries& bars, int period) {
  std::vector<double> out(bars.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return out;
  for (std::size_t i = p - 1; i < bars.size(); ++i) {
    double hh, ll;
    windowExtremes(bars, i, p, hh, ll);
    out[i] = hh > ll ? (hh - bars[i].close) / (hh - ll) * -100.0 : -50.0;
  }
  return out;
}

std::vector<double> computeCci(const BarSeries& bars, int period) {
  std::vector<double> out(bars.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return out;

  std::vector<double> tp;
  tp.reserve(bars.size());
  for (const auto& b : bars) tp.push_back(typicalPrice(b));
  auto mean = computeSma(tp, period);

  for (std::size_t i = p - 1; i < bars.size(); ++i) {
    double dev = 0;
    for (std::size_t j = i + 1 - p; j <= i; ++j) dev += std::fabs(tp[j] - mean[i]);
    dev /= static_cast<double>(p);
    out[i] = dev > 0 ? (tp[i] - mean[i]) / (0.015 * dev) : 0.0;
  }
  return out;
}

std::vector<double> computeRoc(const std::vector<double>& closes, int period) {
  std::vector<double> out(closes.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return out;
  for (std::size_t i = p; i < closes.size(); ++i) {
    double ref = closes[i - p];
    out[i] = ref > 0 ? (closes[i] - ref) / ref * 100.0 : 0.0;
  }
  return out;
}

std::vector<double> computeMomentum(const std::vector<double>& closes, int period) {
  std::vector<double> out(closes.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return out;
  for (std::size_t i = p; i < closes.size(); ++i) out[i] = closes[i] - closes[i - p];
  return out;
}

std::vector<double> computeTrueRange(const BarSeries& bars) {
  std::vector<double> tr(bars.size(), kNaN);
  for (std::size_t i = 0; i < bars.size(); ++i) {
    double hl = bars[i].high - bars[i].low;
    if (i == 0) {
      tr[i] = hl;
      continue;
    }
    double pc = bars[i - 1].close;
    tr[i] = std::max(hl, std::max(std::fabs(bars[i].high - pc), std::fabs(bars[i].low - pc)));
  }
  return tr;
}

std::vector<double> computeAtr(const BarSeries& bars, int period) {
  return computeWilder(computeTrueRange(bars), period, 0);
}

DirectionalSeries computeDirectional(const BarSeries& bars, int period) {
  DirectionalSeries r;
  const std::size_t n = bars.size();
  r.plusDi.assign(n, kNaN);
  r.minusDi.assign(n, kNaN);
  r.adx.assign(n, kNaN);
  const std::size_t p = sz(period);
  if (p < 1 || n < p + 1) return r;

  auto tr = computeTrueRange(bars);
  std::vector<double> pdm(n, 0.0), mdm(n, 0.0);
  for (std::size_t i = 1; i < n; ++i) {
    double up = bars[i].high - bars[i - 1].high;
    double down = bars[i - 1].low - bars[i].low;
    if (up > down && up > 0) pdm[i] = up;
    if (down > up && down > 0) mdm[i] = down;
  }

  // Wilder running sums seeded over bars 1..p
  double sTr = 0, sP = 0, sM = 0;
  for (std::size_t i = 1; i <= p; ++i) {
    sTr += tr[i];
    sP += pdm[i];
    sM += mdm[i];
  }

  std::vector<double> dx(n, kNaN);
  const double pd = static_cast<double>(p);
  for (std::size_t i = p; i < n; ++i) {
    if (i > p) {
      sTr = sTr - sTr / pd + tr[i];
      sP = sP - sP / pd + pdm[i];
      sM = sM - sM / pd + mdm[i];
    }
    double pdi = sTr > 0 ? 100.0 * sP / sTr : 0.0;
    double mdi = sTr > 0 ? 100.0 * sM / sTr : 0.0;
    r.plusDi[i] = pdi;
    r.minusDi[i] = mdi;
    double sum = pdi + mdi;
    dx[i] = sum > 0 ? 100.0 * std::fabs(pdi - mdi) / sum : 0.0;
  }

  r.adx = computeWilder(dx, period, period);
  return r;
}

SarSeries computeParabolicSar(const BarSeries& bars, double step, double maxStep) {
  SarSeries r;
  const std::size_t n = bars.size();
  r.sar.assign(n, kNaN);
  r.trend.assign(n, kNaN);
  if (n < 2) return r;

  bool up = bars[1].close >= bars[0].close;
  double sar = up ? bars[0].low : bars[0].high;
  double ep = up ? bars[1].high : bars[1].low;
  double af = step;
  r.sar[1] = sar;
  r.trend[1] = up ? 1.0 : -1.0;

  for (std::size_t i = 2; i < n; ++i) {
    sar = sar + af * (ep - sar);
    if (up) {
      sar = std::min(sar, std::min(bars[i - 1].low, bars[i - 2].low));
      if (bars[i].low < sar) {
        up = false;
        sar = ep;
        ep = bars[i].low;
        af = step;
      } else if (bars[i].high > ep) {
        ep = bars[i].high;
        af = std::min(af + step, maxStep);
      }
    } else {
      sar = std::max(sar, std::max(bars[i - 1].high, bars[i - 2].high));
      if (bars[i].high > sar) {
        up = true;
        sar = ep;
        ep = bars[i].high;
        af = step;
      } else if (bars[i].low < ep) {
        ep = bars[i].low;
        af = std::min(af + step, maxStep);
      }
    }
    r.sar[i] = sar;
    r.trend[i] = up ? 1.0 : -1.0;
  }
  return r;
}

std::vector<double> computeObv(const BarSeries& bars) {
  std::vector<double> out(bars.size(), kNaN);
  double obv = 0;
  for (std::size_t i = 0; i < bars.size(); ++i) {
    if (i > 0) {
      if (bars[i].close > bars[i - 1].close) obv += bars[i].volume;
      else if (bars[i].close < bars[i - 1].close) obv -= bars[i].volume;
    }
    out[i] = obv;
  }
  return out;
}

std::vector<double> computeVwap(const BarSeries& bars) {
  std::vector<double> out(bars.size(), kNaN);
  double pv = 0, vol = 0;
  for (std::size_t i = 0; i < bars.size(); ++i) {
    double tp = typicalPrice(bars[i]);
    pv += tp * bars[i].volume;
    vol += bars[i].volume;
    out[i] = vol > 0 ? pv / vol : tp;
  }
  return out;
}

std::vector<double> computeMfi(const BarSeries& bars, int period) {
  std::vector<double> out(bars.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return out;

  for (std::size_t i = p; i < bars.size(); ++i) {
    double pos = 0, neg = 0;
    for (std::size_t j = i + 1 - p; j <= i; ++j) {
      double tp = typicalPrice(bars[j]);
      double prev = typicalPrice(bars[j - 1]);
      double flow = tp * bars[j].volume;
      if (tp > prev) pos += flow;
      else if (tp < prev) neg += flow;
    }
    if (neg == 0) out[i] = pos == 0 ? 50.0 : 100.0;
    else out[i] = 100.0 - 100.0 / (1.0 + pos / neg);
  }
  return out;
}

std::vector<double> computeAccumDist(const BarSeries& bars) {
  std::vector<double> out(bars.size(), kNaN);
  double ad = 0;
  for (std::size_t i = 0; i < bars.size(); ++i) {
    const PriceBar& b = bars[i];
    double range = b.high - b.low;
    double clv = range > 0 ? ((b.close - b.low) - (b.high - b.close)) / range : 0.0;
    ad += clv * b.volume;
    out[i] = ad;
  }
  return out;
}

std::vector<double> computeChaikin(const BarSeries& bars, int fast, int slow) {
  auto ad = computeAccumDist(bars);
  auto f = computeEma(ad, fast);
  auto s = computeEma(ad, slow);
  std::vector<double> out(bars.size(), kNaN);
  for (std::size_t i = 0; i < bars.size(); ++i) {
    if (!std::isnan(f[i]) && !std::isnan(s[i])) out[i] = f[i] - s[i];
  }
  return out;
}

AroonSeries computeAroon(const BarSeries& bars, int period) {
  AroonSeries r;
  r.up.assign(bars.size(), kNaN);
  r.down.assign(bars.size(), kNaN);
  r.oscillator.assign(bars.size(), kNaN);
  const std::size_t p = sz(period);
  if (p < 1) return r;

  const double pd = static_cast<double>(p);
  for (std::size_t i = p; i < bars.size(); ++i) {
    std::size_t hiIdx = i - p, loIdx = i - p;
    for (std::size_t j = i - p; j <= i; ++j) {
      if (bars[j].high >= bars[hiIdx].high) hiIdx = j;
      if (bars[j].low <= bars[loIdx].low) loIdx = j;
    }
    r.up[i] = (pd - static_cast<double>(i - hiIdx)) / pd * 100.0;
    r.down[i] = (pd - static_cast<double>(i - loIdx)) / pd * 100.0;
    r.oscillator[i] = r.up[i] - r.down[i];
  }
  return r;
}

std::vector<double> computeTrix(const std::vector<double>& closes, int period) {
  auto e3 = computeEma(computeEma(computeEma(closes, period), period), period);
  std::vector<double> out(closes.size(), kNaN);
  for (std::size_t i = 1; i < closes.size(); ++i) {
    if (std::isnan(e3[i]) || std::isnan(e3[i - 1])) continue;
    out[i] = e3[i - 1] != 0 ? (e3[i] - e3[i - 1]) / e3[i - 1] * 10000.0 : 0.0;
  }
  return out;
}

std::vector<double> computeUltimateOscillator(const BarSeries& bars, int shortP, int midP,
                                              int longP) {
  std::vector<double> out(bars.size(), kNaN);
  const std::size_t ps = sz(shortP), pm = sz(midP), pl = sz(longP);
  if (ps < 1 || pm < 1 || pl < 1) return out;
  const std::size_t longest = std::max(ps, std::max(pm, pl));

  std::vector<double> bp(bars.size(), 0.0), tr(bars.size(), 0.0);
  for (std::size_t i = 1; i < bars.size(); ++i) {
    double pc = bars[i - 1].close;
    double lo = std::min(bars[i].low, pc);
    double hi = std::max(bars[i].high, pc);
    bp[i] = bars[i].close - lo;
    tr[i] = hi - lo;
  }

  auto average = [&](std::size_t i, std::size_t p) {
    double b = 0, t = 0;
    for (std::size_t j = i + 1 - p; j <= i; ++j) {
      b += bp[j];
      t += tr[j];
    }
    return t > 0 ? b / t : 0.5;
  };

  for (std::size_t i = longest; i < bars.size(); ++i) {
    out[i] = 100.0 * (4.0 * average(i, ps) + 2.0 * average(i, pm) + average(i, pl)) / 7.0;
  }
  return out;
}

VolumeProfileSeries computeVolumeProfile(const BarSeries& bars, int bins) {
  VolumeProfileSeries r;
  const std::size_t n = bars.size();
  r.bin.assign(n, kNaN);
  r.binVolume.assign(n, kNaN);
  r.binPrice.assign(n, kNaN);
  if (n == 0 || bins < 1) return r;

  double lo = bars.front().low, hi = bars.front().high;
  for (const auto& b : bars) {
    lo = std::min(lo, b.low);
    hi = std::max(hi, b.high);
  }
  r.priceMin = lo;
  r.priceMax = hi;

  // A flat series collapses into a single bin.
  const std::size_t count = hi > lo ? static_cast<std::size_t>(bins) : 1;
  const double width = hi > lo ? (hi - lo) / static_cast<double>(count) : 1.0;
  r.profile.assign(count, 0.0);

  std::vector<std::size_t> owner(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    double tp = typicalPrice(bars[i]);
    std::size_t b = 0;
    if (hi > lo) {
      auto raw = static_cast<long>(std::floor((tp - lo) / width));
      b = static_cast<std::size_t>(std::max(0L, std::min(static_cast<long>(count) - 1, raw)));
    }
    owner[i] = b;
    r.profile[b] += bars[i].volume;
  }
  for (std::size_t i = 0; i < n; ++i) {
    r.bin[i] = static_cast<double>(owner[i]);
    r.binVolume[i] = r.profile[owner[i]];
    r.binPrice[i] = hi > lo ? lo + (static_cast<double>(owner[i]) + 0.5) * width : lo;
  }
  return r;
}

} // namespace vc
