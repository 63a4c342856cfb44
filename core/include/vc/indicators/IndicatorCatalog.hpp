#pragma once
#include "vc/core/Error.hpp"
#include "vc/indicators/IndicatorTypes.hpp"

#include <string>
#include <vector>

namespace vc {

// Fills `out.values` (one column per plot, one value per bar).
// Returns false with `err` set on invalid parameters.
using IndicatorFn = bool (*)(const BarSeries& bars, const IndicatorParams& params,
                             IndicatorResult& out, Error& err);

using ScalarFn = bool (*)(const ScalarInputs& in, double& out, Error& err);

struct IndicatorSpec {
  std::string id;
  std::string category;          // "trend", "momentum", "volatility", "volume"
  std::vector<std::string> plots;
  IndicatorParams defaults;
  IndicatorFn compute{nullptr};
};

struct ScalarMetricSpec {
  std::string id;
  std::string category;          // "risk", "fundamental"
  ScalarFn compute{nullptr};
};

// The set of computations an engine accepts. Built once and handed to the
// engine; ids outside the catalog are rejected.
class IndicatorCatalog {
public:
  void add(IndicatorSpec spec);
  void addScalar(ScalarMetricSpec spec);

  const IndicatorSpec* find(const std::string& id) const;
  const ScalarMetricSpec* findScalar(const std::string& id) const;

  std::vector<std::string> ids() const;
  std::vector<std::string> scalarIds() const;
  std::size_t size() const { return specs_.size(); }

private:
  std::vector<IndicatorSpec> specs_;
  std::vector<ScalarMetricSpec> scalars_;
};

// MA EMA WMA HMA MACD ADX DMI PSAR RSI KDJ STOCH WILLIAMS CCI ROC MOM BOLL ATR
// KELTNER DONCHIAN STDDEV OBV VWAP MFI AD CHAIKIN VOLUME_PROFILE AROON TRIX
// ULTOSC; scalars SHARPE SORTINO CALMAR ALPHA BETA MAX_DRAWDOWN VAR PE PB ROE
// DEBT_RATIO.
IndicatorCatalog defaultIndicatorCatalog();

} // namespace vc
