#pragma once
#include "vc/core/Error.hpp"
#include "vc/data/PriceBar.hpp"

#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace vc {

// Named numeric/string parameters. Keys are kept sorted so the canonical
// JSON form is stable and can key the result cache.
class IndicatorParams {
public:
  IndicatorParams& set(const std::string& key, double value);
  IndicatorParams& set(const std::string& key, const std::string& value);
  IndicatorParams& set(const std::string& key, const char* value) {
    return set(key, std::string(value));
  }

  bool has(const std::string& key) const;
  double number(const std::string& key, double fallback) const;
  int integer(const std::string& key, int fallback) const;
  std::string text(const std::string& key, const std::string& fallback) const;

  // Keys missing here are taken from `defaults`.
  IndicatorParams withDefaults(const IndicatorParams& defaults) const;

  std::string toJson() const;
  // Accepts a flat object of numbers and strings.
  static bool fromJson(const std::string& json, IndicatorParams& out, Error& err);

  const std::map<std::string, double>& numbers() const { return numbers_; }
  const std::map<std::string, std::string>& texts() const { return texts_; }

private:
  std::map<std::string, double> numbers_;
  std::map<std::string, std::string> texts_;
};

// Column-major result: values[plot][bar]. One entry per input bar in every
// column; NaN is null (warm-up).
struct IndicatorResult {
  std::string id;
  std::vector<std::string> plots;
  std::vector<TimeMs> timestamps;
  std::vector<std::vector<double>> values;

  std::size_t size() const { return timestamps.size(); }

  // nullptr when the plot does not exist.
  const std::vector<double>* column(const std::string& plot) const;

  bool hasValue(std::size_t plot, std::size_t bar) const {
    return plot < values.size() && bar < values[plot].size() && !std::isnan(values[plot][bar]);
  }
  // True when every plot is null at `bar`.
  bool isNull(std::size_t bar) const;
};

// Inputs to scalar metrics.
struct ScalarInputs {
  std::vector<double> returns;
  std::vector<double> prices;
  std::vector<double> benchmarkReturns;
  double riskFreeRate{0.02};
  double confidence{0.05};
  std::map<std::string, double> fundamentals;   // "price", "eps", "bookValue", ...

  std::string toJson() const;
};

} // namespace vc
