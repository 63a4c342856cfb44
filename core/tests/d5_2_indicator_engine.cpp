// D5.2: IndicatorEngine catalog dispatch, parameter validation and result caching

#include "vc/indicators/IndicatorEngine.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

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

static vc::BarSeries makeBars(int count, double drift) {
  vc::BarSeries bars;
  double price = 40.0;
  for (int i = 0; i < count; ++i) {
    vc::PriceBar b;
    b.timestamp = 1700000000000LL + i * vc::kDayMs;
    b.open = price;
    price += std::sin(i * 0.45) * 0.9 + drift;
    b.close = price;
    b.high = std::fmax(b.open, b.close) + 0.4;
    b.low = std::fmin(b.open, b.close) - 0.3;
    b.volume = 20000.0 + (i % 9) * 1500.0;
    bars.push_back(b);
  }
  return bars;
}

int main() {
  using namespace vc;
  const BarSeries bars = makeBars(150, 0.05);

  // ---- Test 1: identical requests share one computation ----
  {
    IndicatorEngine engine;
    IndicatorOutcome a = engine.calculate("MA", bars, IndicatorParams().set("period", 20));
    requireTrue(a.ok && !a.fromCache, "computed");
    requireTrue(engine.computeCount() == 1, "one computation");

    IndicatorOutcome b = engine.calculate("MA", bars, IndicatorParams().set("period", 20));
    requireTrue(b.ok && b.fromCache, "served from cache");
    requireTrue(b.result == a.result, "same shared result");
    requireTrue(engine.computeCount() == 1, "no recomputation");

    // Defaults spelled out explicitly hit the same entry.
    IndicatorOutcome c = engine.calculate(
        "MA", bars, IndicatorParams().set("source", "close").set("period", 20));
    requireTrue(c.fromCache, "explicit default is the same request");
    IndicatorOutcome d = engine.calculate("MA", bars);
    requireTrue(d.fromCache, "period 20 is the default");

    engine.calculate("MA", bars, IndicatorParams().set("period", 10));
    requireTrue(engine.computeCount() == 2, "different params compute again");
    requireTrue(engine.cacheSize() == 2, "two entries");
    requireTrue(engine.stats().cacheHits == 3, "hits counted");

    engine.clearCache();
    requireTrue(engine.cacheSize() == 0, "cleared");
    IndicatorOutcome e = engine.calculate("MA", bars, IndicatorParams().set("period", 20));
    requireTrue(!e.fromCache && engine.computeCount() == 3, "recomputed after clear");
    requireTrue(a.result->values[0].size() == bars.size(), "earlier result still alive");
    std::printf("  Test 1 (cache identity): PASS\n");
  }

  // ---- Test 2: the key depends on the bars ----
  {
    IndicatorEngine engine;
    BarSeries changed = bars;
    changed.back().close += 0.01;
    std::string k1 = engine.cacheKey("RSI", bars, IndicatorParams{});
    std::string k2 = engine.cacheKey("RSI", changed, IndicatorParams{});
    requireTrue(!k1.empty() && k1 != k2, "edited bar changes the key");
    requireTrue(k1.compare(0, 4, "RSI|") == 0, "key starts with the id");
    requireTrue(engine.cacheKey("NOPE", bars, IndicatorParams{}).empty(), "unknown id has no key");
    requireTrue(barFingerprint(bars) == barFingerprint(BarSeries(bars)), "fingerprint is stable");

    engine.calculate("RSI", bars);
    IndicatorOutcome o = engine.calculate("RSI", changed);
    requireTrue(o.ok && !o.fromCache, "stale result not served");
    requireTrue(engine.computeCount() == 2, "two computations");
    std::printf("  Test 2 (content key): PASS\n");
  }

  // ---- Test 3: errors ----
  {
    IndicatorEngine engine;
    IndicatorOutcome u = engine.calculate("SUPERTREND", bars);
    requireTrue(!u.ok && u.err.code == "UNKNOWN_INDICATOR", "unknown id");
    requireTrue(!u.result, "no result");

    IndicatorOutcome neg = engine.calculate("RSI", bars, IndicatorParams().set("period", -3));
    requireTrue(!neg.ok && neg.err.code == "BAD_PARAMS", "negative period");
    IndicatorOutcome frac = engine.calculate("MA", bars, IndicatorParams().set("period", 2.5));
    requireTrue(!frac.ok && frac.err.code == "BAD_PARAMS", "fractional period");
    IndicatorOutcome src = engine.calculate("EMA", bars, IndicatorParams().set("source", "vwap"));
    requireTrue(!src.ok && src.err.code == "BAD_PARAMS", "unknown source");
    IndicatorOutcome macd = engine.calculate(
        "MACD", bars, IndicatorParams().set("fast", 30).set("slow", 10));
    requireTrue(!macd.ok && macd.err.code == "BAD_PARAMS", "fast must be shorter than slow");
    IndicatorOutcome boll = engine.calculate("BOLL", bars, IndicatorParams().set("stdDev", 0.0));
    requireTrue(!boll.ok && boll.err.code == "BAD_PARAMS", "zero band width");

    requireTrue(engine.cacheSize() == 0, "failures are not cached");
    requireTrue(engine.stats().errors == 6, "errors counted");
    std::printf("  Test 3 (errors): PASS\n");
  }

  // ---- Test 4: every catalog indicator yields aligned columns ----
  {
    IndicatorEngine engine;
    std::vector<std::string> ids = engine.catalog().ids();
    requireTrue(ids.size() == 29, "29 indicators");
    for (const auto& id : ids) {
      IndicatorOutcome o = engine.calculate(id, bars);
      requireTrue(o.ok, id.c_str());
      const IndicatorResult& r = *o.result;
      requireTrue(r.id == id, "result id");
      requireTrue(r.values.size() == r.plots.size() && !r.plots.empty(), "one column per plot");
      requireTrue(r.timestamps.size() == bars.size(), "timestamps aligned");
      bool anyValue = false;
      for (const auto& col : r.values) {
        requireTrue(col.size() == bars.size(), "column aligned with the bars");
        for (double v : col) {
          if (!std::isnan(v)) {
            anyValue = true;
            requireTrue(std::isfinite(v), "no infinities");
          }
        }
      }
      requireTrue(anyValue, "150 bars are enough for every default window");
    }
    requireTrue(engine.computeCount() == 29, "one computation each");

    IndicatorOutcome macd = engine.calculate("MACD", bars);
    const std::vector<double>* hist = macd.result->column("Histogram");
    const std::vector<double>* line = macd.result->column("MACD");
    const std::vector<double>* sig = macd.result->column("Signal");
    requireTrue(hist && line && sig, "named columns");
    requireTrue(macd.result->column("Nope") == nullptr, "unknown column");
    requireClose((*hist)[100], (*line)[100] - (*sig)[100], 1e-12, "histogram = macd - signal");
    requireTrue(macd.result->isNull(0) && !macd.result->isNull(100), "null rows");

    IndicatorOutcome empty = engine.calculate("RSI", BarSeries{});
    requireTrue(empty.ok && empty.result->size() == 0, "empty bars give an empty result");
    std::printf("  Test 4 (catalog): PASS\n");
  }

  // ---- Test 5: scalar metrics ----
  {
    IndicatorEngine engine;
    ScalarInputs in;
    for (int i = 0; i < 60; ++i) {
      in.returns.push_back(0.001 + 0.01 * std::sin(i * 0.9));
      in.benchmarkReturns.push_back(0.0005 + 0.008 * std::sin(i * 0.9 + 0.2));
    }

    ScalarOutcome s1 = engine.calculateScalar("SHARPE", in);
    requireTrue(s1.ok && !s1.fromCache, "sharpe computed");
    ScalarOutcome s2 = engine.calculateScalar("SHARPE", in);
    requireTrue(s2.fromCache && s2.value == s1.value, "sharpe cached");
    requireTrue(engine.scalarComputeCount() == 1, "one scalar computation");

    ScalarInputs other = in;
    other.riskFreeRate = 0.05;
    ScalarOutcome s3 = engine.calculateScalar("SHARPE", other);
    requireTrue(!s3.fromCache && s3.value < s1.value, "risk-free rate is part of the key");

    const char* ids[] = {"SORTINO", "CALMAR", "ALPHA", "BETA", "MAX_DRAWDOWN", "VAR"};
    for (const char* id : ids) {
      ScalarOutcome o = engine.calculateScalar(id, in);
      requireTrue(o.ok && std::isfinite(o.value), id);
    }
    requireTrue(engine.calculateScalar("BETA", in).value > 0, "correlated benchmark");
    requireTrue(engine.calculateScalar("VAR", in).value < 0, "VaR reads as a loss");

    ScalarOutcome u = engine.calculateScalar("OMEGA", in);
    requireTrue(!u.ok && u.err.code == "UNKNOWN_METRIC", "unknown metric");

    ScalarInputs f;
    f.fundamentals["price"] = 30.0;
    f.fundamentals["eps"] = 2.0;
    ScalarOutcome pe = engine.calculateScalar("PE", f);
    requireTrue(pe.ok, "PE");
    requireClose(pe.value, 15.0, 1e-12, "price / eps");
    ScalarOutcome pb = engine.calculateScalar("PB", f);
    requireTrue(!pb.ok && pb.err.code == "BAD_INPUT", "missing book value");

    f.fundamentals["eps"] = -1.0;
    requireClose(engine.calculateScalar("PE", f).value, 0.0, 1e-12, "negative earnings read 0");

    ScalarInputs roe;
    roe.fundamentals["netIncome"] = 12.0;
    roe.fundamentals["equity"] = 80.0;
    requireClose(engine.calculateScalar("ROE", roe).value, 15.0, 1e-12, "ROE percent");

    requireTrue(engine.catalog().scalarIds().size() == 11, "11 scalar metrics");
    engine.clearScalarCache();
    requireTrue(engine.scalarCacheSize() == 0, "scalar cache cleared");
    std::printf("  Test 5 (scalars): PASS\n");
  }

  // ---- Test 6: params JSON ----
  {
    IndicatorParams p;
    Error err;
    requireTrue(IndicatorParams::fromJson("{\"period\":14,\"source\":\"hl2\"}", p, err), "parsed");
    requireTrue(p.integer("period", 0) == 14 && p.text("source", "") == "hl2", "values");
    requireTrue(p.toJson() == "{\"period\":14.0,\"source\":\"hl2\"}" ||
                p.toJson() == "{\"period\":14,\"source\":\"hl2\"}", "canonical form");
    requireTrue(!IndicatorParams::fromJson("{\"period\":[1]}", p, err), "nested value rejected");
    requireTrue(err.code == "BAD_PARAMS", "error code");
    requireTrue(!IndicatorParams::fromJson("not json", p, err), "malformed rejected");

    IndicatorParams b = IndicatorParams().set("b", 1).set("a", 2);
    IndicatorParams a = IndicatorParams().set("a", 2).set("b", 1);
    requireTrue(a.toJson() == b.toJson(), "key order does not matter");
    std::printf("  Test 6 (params): PASS\n");
  }

  // ---- Test 7: the cache is bounded, least recently used goes first ----
  {
    IndicatorEngine engine;
    engine.setMaxCacheEntries(3);
    requireTrue(engine.maxCacheEntries() == 3, "cap set");

    for (int p = 2; p <= 6; ++p) {
      engine.calculate("MA", bars, IndicatorParams().set("period", p));
      requireTrue(engine.cacheSize() <= 3, "never above the cap");
    }
    requireTrue(engine.cacheSize() == 3, "filled to the cap");
    requireTrue(engine.computeCount() == 5, "five computations");

    // Periods 4, 5 and 6 remain; touching 4 makes 5 the oldest.
    requireTrue(engine.calculate("MA", bars, IndicatorParams().set("period", 4)).fromCache,
                "recent entry kept");
    requireTrue(!engine.calculate("MA", bars, IndicatorParams().set("period", 2)).fromCache,
                "oldest entry evicted");
    requireTrue(engine.calculate("MA", bars, IndicatorParams().set("period", 4)).fromCache,
                "touched entry survived the insert");
    requireTrue(!engine.calculate("MA", bars, IndicatorParams().set("period", 5)).fromCache,
                "least recently used evicted");

    ScalarInputs in;
    for (int i = 0; i < 30; ++i) in.returns.push_back(0.002 * std::sin(i * 0.7));
    for (int k = 0; k < 5; ++k) {
      in.riskFreeRate = 0.01 * k;
      engine.calculateScalar("SHARPE", in);
    }
    requireTrue(engine.scalarCacheSize() == 3, "scalar cache bounded too");

    engine.setMaxCacheEntries(1);
    requireTrue(engine.cacheSize() == 1 && engine.scalarCacheSize() == 1, "shrunk at once");
    engine.setMaxCacheEntries(0);
    requireTrue(engine.maxCacheEntries() == 1, "zero treated as one");
    std::printf("  Test 7 (bounded cache): PASS\n");
  }

  std::printf("D5.2 indicator engine: ALL PASS\n");
  return 0;
}
