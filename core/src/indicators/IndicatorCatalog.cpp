#include "vc/indicators/IndicatorCatalog.hpp"
#include "vc/math/Indicators.hpp"
#include "vc/math/MovingAverages.hpp"
#include "vc/math/RiskMetrics.hpp"

#include <cmath>
#include <initializer_list>
#include <utility>

namespace vc {

void IndicatorCatalog::add(IndicatorSpec spec) {
  for (auto& s : specs_) {
    if (s.id == spec.id) {
      s = std::move(spec);
      return;
    }
  }
  specs_.push_back(std::move(spec));
}

void IndicatorCatalog::addScalar(ScalarMetricSpec spec) {
  for (auto& s : scalars_) {
    if (s.id == spec.id) {
      s = std::move(spec);
      return;
    }
  }
  scalars_.push_back(std::move(spec));
}

const IndicatorSpec* IndicatorCatalog::find(const std::string& id) const {
  for (const auto& s : specs_) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

const ScalarMetricSpec* IndicatorCatalog::findScalar(const std::string& id) const {
  for (const auto& s : scalars_) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

std::vector<std::string> IndicatorCatalog::ids() const {
  std::vector<std::string> out;
  for (const auto& s : specs_) out.push_back(s.id);
  return out;
}

std::vector<std::string> IndicatorCatalog::scalarIds() const {
  std::vector<std::string> out;
  for (const auto& s : scalars_) out.push_back(s.id);
  return out;
}

// ---- Parameter helpers ----

static bool readPeriod(const IndicatorParams& p, const char* key, int& out, Error& err) {
  double v = p.number(key, std::nan(""));
  if (!std::isfinite(v) || v < 1 || v > 5000 || v != std::floor(v)) {
    err = makeError("BAD_PARAMS", std::string("'") + key + "' must be an integer in [1, 5000]");
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

static bool readPositive(const IndicatorParams& p, const char* key, double& out, Error& err) {
  double v = p.number(key, std::nan(""));
  if (!std::isfinite(v) || v <= 0) {
    err = makeError("BAD_PARAMS", std::string("'") + key + "' must be a positive number");
    return false;
  }
  out = v;
  return true;
}

static bool readSource(const IndicatorParams& p, std::vector<double>& series,
                       const BarSeries& bars, Error& err) {
  std::string name = p.text("source", "close");
  PriceSource src;
  if (!parsePriceSource(name, src)) {
    err = makeError("BAD_PARAMS", "unknown source '" + name + "'");
    return false;
  }
  series = extractSource(bars, src);
  return true;
}

// ---- Trend ----

template <std::vector<double> (*Average)(const std::vector<double>&, int)>
static bool averageFn(const BarSeries& bars, const IndicatorParams& p,
                      IndicatorResult& out, Error& err) {
  int period;
  std::vector<double> series;
  if (!readPeriod(p, "period", period, err) || !readSource(p, series, bars, err)) return false;
  out.values = {Average(series, period)};
  return true;
}

static bool macdFn(const BarSeries& bars, const IndicatorParams& p,
                   IndicatorResult& out, Error& err) {
  int fast, slow, signal;
  if (!readPeriod(p, "fast", fast, err) || !readPeriod(p, "slow", slow, err) ||
      !readPeriod(p, "signal", signal, err)) return false;
  if (fast >= slow) {
    err = makeError("BAD_PARAMS", "'fast' must be shorter than 'slow'");
    return false;
  }
  auto m = computeMacd(extractSource(bars, PriceSource::Close), fast, slow, signal);
  out.values = {std::move(m.macd), std::move(m.signal), std::move(m.histogram)};
  return true;
}

static bool adxFn(const BarSeries& bars, const IndicatorParams& p,
                  IndicatorResult& out, Error& err) {
  int period;
  if (!readPeriod(p, "period", period, err)) return false;
  out.values = {computeDirectional(bars, period).adx};
  return true;
}

static bool dmiFn(const BarSeries& bars, const IndicatorParams& p,
                  IndicatorResult& out, Error& err) {
  int period;
  if (!readPeriod(p, "period", period, err)) return false;
  auto d = computeDirectional(bars, period);
  out.values = {std::move(d.plusDi), std::move(d.minusDi), std::move(d.adx)};
  return true;
}

static bool psarFn(const BarSeries& bars, const IndicatorParams& p,
                   IndicatorResult& out, Error& err) {
  double step, maxStep;
  if (!readPositive(p, "step", step, err) || !readPositive(p, "max", maxStep, err)) return false;
  auto s = computeParabolicSar(bars, step, maxStep);
  out.values = {std::move(s.sar), std::move(s.trend)};
  return true;
}

// ---- Momentum ----

static bool rsiFn(const BarSeries& bars, const IndicatorParams& p,
                  IndicatorResult& out, Error& err) {
  int period;
  std::vector<double> series;
  if (!readPeriod(p, "period", period, err) || !readSource(p, series, bars, err)) return false;
  out.values = {computeRsi(series, period)};
  return true;
}

static bool kdjFn(const BarSeries& bars, const IndicatorParams& p,
                  IndicatorResult& out, Error& err) {
  int period, smooth;
  if (!readPeriod(p, "period", period, err) || !readPeriod(p, "smooth", smooth, err))
    return false;
  auto k = computeKdj(bars, period, smooth);
  out.values = {std::move(k.k), std::move(k.d), std::move(k.j)};
  return true;
}

static bool stochFn(const BarSeries& bars, const IndicatorParams& p,
                    IndicatorResult& out, Error& err) {
  int kp, dp;
  if (!readPeriod(p, "kPeriod", kp, err) || !readPeriod(p, "dPeriod", dp, err)) return false;
  auto s = computeStochastic(bars, kp, dp);
  out.values = {std::move(s.k), std::move(s.d)};
  return true;
}

template <std::vector<double> (*Fn)(const BarSeries&, int)>
static bool barPeriodFn(const BarSeries& bars, const IndicatorParams& p,
                        IndicatorResult& out, Error& err) {
  int period;
  if (!readPeriod(p, "period", period, err)) return false;
  out.values = {Fn(bars, period)};
  return true;
}

template <std::vector<double> (*Fn)(const std::vector<double>&, int)>
static bool closePeriodFn(const BarSeries& bars, const IndicatorParams& p,
                          IndicatorResult& out, Error& err) {
  int period;
  std::vector<double> series;
  if (!readPeriod(p, "period", period, err) || !readSource(p, series, bars, err)) return false;
  out.values = {Fn(series, period)};
  return true;
}

static bool aroonFn(const BarSeries& bars, const IndicatorParams& p,
                    IndicatorResult& out, Error& err) {
  int period;
  if (!readPeriod(p, "period", period, err)) return false;
  auto a = computeAroon(bars, period);
  out.values = {std::move(a.up), std::move(a.down), std::move(a.oscillator)};
  return true;
}

static bool ultoscFn(const BarSeries& bars, const IndicatorParams& p,
                     IndicatorResult& out, Error& err) {
  int s, m, l;
  if (!readPeriod(p, "short", s, err) || !readPeriod(p, "mid", m, err) ||
      !readPeriod(p, "long", l, err)) return false;
  out.values = {computeUltimateOscillator(bars, s, m, l)};
  return true;
}

// ---- Volatility ----

static bool bollFn(const BarSeries& bars, const IndicatorParams& p,
                   IndicatorResult& out, Error& err) {
  int period;
  double k;
  std::vector<double> series;
  if (!readPeriod(p, "period", period, err) || !readPositive(p, "stdDev", k, err) ||
      !readSource(p, series, bars, err)) return false;
  auto b = computeBollinger(series, period, k);
  out.values = {std::move(b.upper), std::move(b.middle), std::move(b.lower)};
  return true;
}

static bool keltnerFn(const BarSeries& bars, const IndicatorParams& p,
                      IndicatorResult& out, Error& err) {
  int period, atrPeriod;
  double mult;
  if (!readPeriod(p, "period", period, err) || !readPeriod(p, "atrPeriod", atrPeriod, err) ||
      !readPositive(p, "multiplier", mult, err)) return false;
  auto b = computeKeltner(bars, period, atrPeriod, mult);
  out.values = {std::move(b.upper), std::move(b.middle), std::move(b.lower)};
  return true;
}

static bool donchianFn(const BarSeries& bars, const IndicatorParams& p,
                       IndicatorResult& out, Error& err) {
  int period;
  if (!readPeriod(p, "period", period, err)) return false;
  auto b = computeDonchian(bars, period);
  out.values = {std::move(b.upper), std::move(b.middle), std::move(b.lower)};
  return true;
}

// ---- Volume ----

template <std::vector<double> (*Fn)(const BarSeries&)>
static bool cumulativeFn(const BarSeries& bars, const IndicatorParams&,
                         IndicatorResult& out, Error&) {
  out.values = {Fn(bars)};
  return true;
}

static bool chaikinFn(const BarSeries& bars, const IndicatorParams& p,
                      IndicatorResult& out, Error& err) {
  int fast, slow;
  if (!readPeriod(p, "fast", fast, err) || !readPeriod(p, "slow", slow, err)) return false;
  out.values = {computeChaikin(bars, fast, slow)};
  return true;
}

static bool volumeProfileFn(const BarSeries& bars, const IndicatorParams& p,
                            IndicatorResult& out, Error& err) {
  int bins;
  if (!readPeriod(p, "bins", bins, err)) return false;
  auto v = computeVolumeProfile(bars, bins);
  out.values = {std::move(v.bin), std::move(v.binVolume), std::move(v.binPrice)};
  return true;
}

// ---- Scalars ----

static std::vector<double> returnsOf(const ScalarInputs& in) {
  if (!in.returns.empty() || in.prices.size() < 2) return in.returns;
  std::vector<double> r;
  for (std::size_t i = 1; i < in.prices.size(); ++i) {
    double prev = in.prices[i - 1];
    r.push_back(prev > 0 ? in.prices[i] / prev - 1.0 : 0.0);
  }
  return r;
}

static std::vector<double> pricesOf(const ScalarInputs& in) {
  return in.prices.empty() ? pricesFromReturns(in.returns) : in.prices;
}

static bool sharpeFn(const ScalarInputs& in, double& out, Error&) {
  out = computeSharpe(returnsOf(in), in.riskFreeRate);
  return true;
}

static bool sortinoFn(const ScalarInputs& in, double& out, Error&) {
  out = computeSortino(returnsOf(in), in.riskFreeRate);
  return true;
}

static bool calmarFn(const ScalarInputs& in, double& out, Error&) {
  out = computeCalmar(pricesOf(in));
  return true;
}

static bool maxDrawdownFn(const ScalarInputs& in, double& out, Error&) {
  out = computeMaxDrawdown(pricesOf(in));
  return true;
}

static bool betaFn(const ScalarInputs& in, double& out, Error&) {
  out = computeBeta(returnsOf(in), in.benchmarkReturns);
  return true;
}

static bool alphaFn(const ScalarInputs& in, double& out, Error&) {
  out = computeAlpha(returnsOf(in), in.benchmarkReturns, in.riskFreeRate);
  return true;
}

static bool varFn(const ScalarInputs& in, double& out, Error&) {
  out = computeHistoricalVar(returnsOf(in), in.confidence);
  return true;
}

static bool readFundamentals(const ScalarInputs& in, const char* a, const char* b,
                             double& va, double& vb, Error& err) {
  auto ia = in.fundamentals.find(a);
  auto ib = in.fundamentals.find(b);
  if (ia == in.fundamentals.end() || ib == in.fundamentals.end()) {
    err = makeError("BAD_INPUT", std::string("requires fundamentals '") + a + "' and '" + b + "'");
    return false;
  }
  va = ia->second;
  vb = ib->second;
  return true;
}

// Ratio with a non-positive denominator reads 0.
template <int Scale>
static bool ratio(const ScalarInputs& in, const char* num, const char* den,
                  double& out, Error& err) {
  double n, d;
  if (!readFundamentals(in, num, den, n, d, err)) return false;
  out = d > 0 ? n / d * Scale : 0.0;
  return true;
}

static bool peFn(const ScalarInputs& in, double& out, Error& err) {
  return ratio<1>(in, "price", "eps", out, err);
}
static bool pbFn(const ScalarInputs& in, double& out, Error& err) {
  return ratio<1>(in, "price", "bookValue", out, err);
}
static bool roeFn(const ScalarInputs& in, double& out, Error& err) {
  return ratio<100>(in, "netIncome", "equity", out, err);
}
static bool debtRatioFn(const ScalarInputs& in, double& out, Error& err) {
  return ratio<100>(in, "totalDebt", "totalAssets", out, err);
}

static IndicatorParams params(std::initializer_list<std::pair<const char*, double>> nums,
                              const char* source = nullptr) {
  IndicatorParams p;
  for (const auto& kv : nums) p.set(kv.first, kv.second);
  if (source) p.set("source", source);
  return p;
}

IndicatorCatalog defaultIndicatorCatalog() {
  IndicatorCatalog c;

  c.add({"MA", "trend", {"MA"}, params({{"period", 20}}, "close"),
         &averageFn<computeSma>});
  c.add({"EMA", "trend", {"EMA"}, params({{"period", 20}}, "close"),
         &averageFn<computeEma>});
  c.add({"WMA", "trend", {"WMA"}, params({{"period", 20}}, "close"),
         &averageFn<computeWma>});
  c.add({"HMA", "trend", {"HMA"}, params({{"period", 20}}, "close"),
         &averageFn<computeHma>});
  c.add({"MACD", "trend", {"MACD", "Signal", "Histogram"},
         params({{"fast", 12}, {"slow", 26}, {"signal", 9}}), &macdFn});
  c.add({"ADX", "trend", {"ADX"}, params({{"period", 14}}), &adxFn});
  c.add({"DMI", "trend", {"PDI", "MDI", "ADX"}, params({{"period", 14}}), &dmiFn});
  c.add({"PSAR", "trend", {"SAR", "Trend"}, params({{"step", 0.02}, {"max", 0.2}}), &psarFn});

  c.add({"RSI", "momentum", {"RSI"}, params({{"period", 14}}, "close"), &rsiFn});
  c.add({"KDJ", "momentum", {"K", "D", "J"}, params({{"period", 9}, {"smooth", 3}}), &kdjFn});
  c.add({"STOCH", "momentum", {"K", "D"}, params({{"kPeriod", 14}, {"dPeriod", 3}}),
         &stochFn});
  c.add({"WILLIAMS", "momentum", {"WR"}, params({{"period", 14}}),
         &barPeriodFn<computeWilliamsR>});
  c.add({"CCI", "momentum", {"CCI"}, params({{"period", 20}}), &barPeriodFn<computeCci>});
  c.add({"ROC", "momentum", {"ROC"}, params({{"period", 10}}, "close"),
         &closePeriodFn<computeRoc>});
  c.add({"MOM", "momentum", {"MOM"}, params({{"period", 10}}, "close"),
         &closePeriodFn<computeMomentum>});
  c.add({"AROON", "momentum", {"Up", "Down", "Oscillator"}, params({{"period", 14}}),
         &aroonFn});
  c.add({"TRIX", "momentum", {"TRIX"}, params({{"period", 14}}, "close"),
         &closePeriodFn<computeTrix>});
  c.add({"ULTOSC", "momentum", {"UO"}, params({{"short", 7}, {"mid", 14}, {"long", 28}}),
         &ultoscFn});

  c.add({"BOLL", "volatility", {"Upper", "Middle", "Lower"},
         params({{"period", 20}, {"stdDev", 2}}, "close"), &bollFn});
  c.add({"ATR", "volatility", {"ATR"}, params({{"period", 14}}), &barPeriodFn<computeAtr>});
  c.add({"KELTNER", "volatility", {"Upper", "Middle", "Lower"},
         params({{"period", 20}, {"atrPeriod", 10}, {"multiplier", 2}}), &keltnerFn});
  c.add({"DONCHIAN", "volatility", {"Upper", "Middle", "Lower"}, params({{"period", 20}}),
         &donchianFn});
  c.add({"STDDEV", "volatility", {"STDDEV"}, params({{"period", 20}}, "close"),
         &closePeriodFn<computeRollingStd>});

  c.add({"OBV", "volume", {"OBV"}, IndicatorParams{}, &cumulativeFn<computeObv>});
  c.add({"VWAP", "volume", {"VWAP"}, IndicatorParams{}, &cumulativeFn<computeVwap>});
  c.add({"MFI", "volume", {"MFI"}, params({{"period", 14}}), &barPeriodFn<computeMfi>});
  c.add({"AD", "volume", {"AD"}, IndicatorParams{}, &cumulativeFn<computeAccumDist>});
  c.add({"CHAIKIN", "volume", {"CHAIKIN"}, params({{"fast", 3}, {"slow", 10}}), &chaikinFn});
  c.add({"VOLUME_PROFILE", "volume", {"Bin", "BinVolume", "BinPrice"},
         params({{"bins", 24}}), &volumeProfileFn});

  c.addScalar({"SHARPE", "risk", &sharpeFn});
  c.addScalar({"SORTINO", "risk", &sortinoFn});
  c.addScalar({"CALMAR", "risk", &calmarFn});
  c.addScalar({"ALPHA", "risk", &alphaFn});
  c.addScalar({"BETA", "risk", &betaFn});
  c.addScalar({"MAX_DRAWDOWN", "risk", &maxDrawdownFn});
  c.addScalar({"VAR", "risk", &varFn});
  c.addScalar({"PE", "fundamental", &peFn});
  c.addScalar({"PB", "fundamental", &pbFn});
  c.addScalar({"ROE", "fundamental", &roeFn});
  c.addScalar({"DEBT_RATIO", "fundamental", &debtRatioFn});

  return c;
}

} // namespace vc
