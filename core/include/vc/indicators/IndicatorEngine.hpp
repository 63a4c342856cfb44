#pragma once
#include "vc/core/Error.hpp"
#include "vc/debug/Stats.hpp"
#include "vc/indicators/IndicatorCatalog.hpp"
#include "vc/indicators/IndicatorTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace vc {

struct IndicatorOutcome {
  bool ok{false};
  Error err;
  std::shared_ptr<const IndicatorResult> result;
  bool fromCache{false};
};

struct ScalarOutcome {
  bool ok{false};
  Error err;
  double value{0.0};
  bool fromCache{false};
};

// FNV-1a over every field of every bar.
std::uint64_t barFingerprint(const BarSeries& bars);

// Computes catalog indicators and scalar metrics, memoising each result under
// a content key. Each cache holds at most maxCacheEntries() results; the least
// recently used is dropped first.
class IndicatorEngine {
public:
  explicit IndicatorEngine(IndicatorCatalog catalog = defaultIndicatorCatalog());

  // Missing params take the catalog defaults; identical inputs return the
  // same shared result without recomputation.
  IndicatorOutcome calculate(const std::string& id, const BarSeries& bars,
                             const IndicatorParams& params = IndicatorParams{});

  ScalarOutcome calculateScalar(const std::string& metricId, const ScalarInputs& inputs);

  // "<id>|<canonical params>|<fingerprint>", or "" for an unknown id.
  std::string cacheKey(const std::string& id, const BarSeries& bars,
                       const IndicatorParams& params) const;

  void clearCache();
  void clearScalarCache();
  // Evicts down to the new cap immediately. Zero is treated as one.
  void setMaxCacheEntries(std::size_t n);
  std::size_t maxCacheEntries() const { return maxEntries_; }
  std::size_t cacheSize() const { return cache_.size(); }
  std::size_t scalarCacheSize() const { return scalarCache_.size(); }

  std::uint64_t computeCount() const { return stats_.computations; }
  std::uint64_t scalarComputeCount() const { return stats_.scalarComputations; }
  const IndicatorStats& stats() const { return stats_; }

  void setDebug(const DebugToggles& debug) { debug_ = debug; }
  const IndicatorCatalog& catalog() const { return catalog_; }

private:
  template <typename T>
  struct Entry {
    T value;
    std::uint64_t lastUse{0};
  };

  IndicatorCatalog catalog_;
  std::unordered_map<std::string, Entry<std::shared_ptr<const IndicatorResult>>> cache_;
  std::unordered_map<std::string, Entry<double>> scalarCache_;
  std::size_t maxEntries_{256};
  std::uint64_t useClock_{0};
  IndicatorStats stats_;
  DebugToggles debug_;
};

} // namespace vc
