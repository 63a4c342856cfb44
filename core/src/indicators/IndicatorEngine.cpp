#include "vc/indicators/IndicatorEngine.hpp"

#include <cstdio>
#include <cstring>
#include <utility>

namespace vc {

static constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
static constexpr std::uint64_t kFnvPrime = 1099511628211ull;

static void fnvMix(std::uint64_t& h, const void* data, std::size_t len) {
  const auto* p = static_cast<const unsigned char*>(data);
  for (std::size_t i = 0; i < len; ++i) {
    h ^= p[i];
    h *= kFnvPrime;
  }
}

static void fnvMixDouble(std::uint64_t& h, double v) {
  std::uint64_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  fnvMix(h, &bits, sizeof(bits));
}

std::uint64_t barFingerprint(const BarSeries& bars) {
  std::uint64_t h = kFnvOffset;
  std::uint64_t n = bars.size();
  fnvMix(h, &n, sizeof(n));
  for (const auto& b : bars) {
    fnvMix(h, &b.timestamp, sizeof(b.timestamp));
    fnvMixDouble(h, b.open);
    fnvMixDouble(h, b.high);
    fnvMixDouble(h, b.low);
    fnvMixDouble(h, b.close);
    fnvMixDouble(h, b.volume);
  }
  return h;
}

// Drops least recently used entries until `cap` remain.
template <typename Map>
static std::size_t evictLeastRecent(Map& cache, std::size_t cap) {
  std::size_t dropped = 0;
  while (cache.size() > cap) {
    auto victim = cache.begin();
    for (auto it = cache.begin(); it != cache.end(); ++it) {
      if (it->second.lastUse < victim->second.lastUse) victim = it;
    }
    cache.erase(victim);
    ++dropped;
  }
  return dropped;
}

IndicatorEngine::IndicatorEngine(IndicatorCatalog catalog)
  : catalog_(std::move(catalog)) {}

std::string IndicatorEngine::cacheKey(const std::string& id, const BarSeries& bars,
                                      const IndicatorParams& params) const {
  const IndicatorSpec* spec = catalog_.find(id);
  if (!spec) return {};
  char fp[17];
  std::snprintf(fp, sizeof(fp), "%016llx",
                static_cast<unsigned long long>(barFingerprint(bars)));
  return id + "|" + params.withDefaults(spec->defaults).toJson() + "|" + fp;
}

IndicatorOutcome IndicatorEngine::calculate(const std::string& id, const BarSeries& bars,
                                            const IndicatorParams& params) {
  IndicatorOutcome out;
  const IndicatorSpec* spec = catalog_.find(id);
  if (!spec || !spec->compute) {
    out.err = makeError("UNKNOWN_INDICATOR", "unknown indicator '" + id + "'");
    ++stats_.errors;
    std::fprintf(stderr, "[IndicatorEngine] %s\n", out.err.message.c_str());
    return out;
  }

  std::string key = cacheKey(id, bars, params);
  auto hit = cache_.find(key);
  if (hit != cache_.end()) {
    ++stats_.cacheHits;
    if (debug_.logIndicators) {
      std::fprintf(stderr, "[IndicatorEngine] cache hit %s\n", key.c_str());
    }
    hit->second.lastUse = ++useClock_;
    out.ok = true;
    out.result = hit->second.value;
    out.fromCache = true;
    return out;
  }

  auto result = std::make_shared<IndicatorResult>();
  result->id = id;
  result->plots = spec->plots;
  result->timestamps.reserve(bars.size());
  for (const auto& b : bars) result->timestamps.push_back(b.timestamp);

  IndicatorParams merged = params.withDefaults(spec->defaults);
  if (!spec->compute(bars, merged, *result, out.err)) {
    ++stats_.errors;
    std::fprintf(stderr, "[IndicatorEngine] %s %s: %s\n", id.c_str(),
                 out.err.code.c_str(), out.err.message.c_str());
    return out;
  }
  ++stats_.computations;
  if (debug_.logIndicators) {
    std::fprintf(stderr, "[IndicatorEngine] computed %s over %zu bars\n",
                 id.c_str(), bars.size());
  }

  out.ok = true;
  out.result = result;
  cache_[std::move(key)] = {std::move(result), ++useClock_};
  std::size_t dropped = evictLeastRecent(cache_, maxEntries_);
  if (dropped > 0 && debug_.logIndicators) {
    std::fprintf(stderr, "[IndicatorEngine] evicted %zu cached result(s)\n", dropped);
  }
  return out;
}

ScalarOutcome IndicatorEngine::calculateScalar(const std::string& metricId,
                                               const ScalarInputs& inputs) {
  ScalarOutcome out;
  const ScalarMetricSpec* spec = catalog_.findScalar(metricId);
  if (!spec || !spec->compute) {
    out.err = makeError("UNKNOWN_METRIC", "unknown metric '" + metricId + "'");
    ++stats_.errors;
    std::fprintf(stderr, "[IndicatorEngine] %s\n", out.err.message.c_str());
    return out;
  }

  std::string key = metricId + "|" + inputs.toJson();
  auto hit = scalarCache_.find(key);
  if (hit != scalarCache_.end()) {
    ++stats_.scalarCacheHits;
    hit->second.lastUse = ++useClock_;
    out.ok = true;
    out.value = hit->second.value;
    out.fromCache = true;
    return out;
  }

  double value = 0.0;
  if (!spec->compute(inputs, value, out.err)) {
    ++stats_.errors;
    std::fprintf(stderr, "[IndicatorEngine] %s %s: %s\n", metricId.c_str(),
                 out.err.code.c_str(), out.err.message.c_str());
    return out;
  }
  ++stats_.scalarComputations;
  if (debug_.logIndicators) {
    std::fprintf(stderr, "[IndicatorEngine] %s = %g\n", metricId.c_str(), value);
  }

  out.ok = true;
  out.value = value;
  scalarCache_[std::move(key)] = {value, ++useClock_};
  evictLeastRecent(scalarCache_, maxEntries_);
  return out;
}

void IndicatorEngine::clearCache() {
  cache_.clear();
}

void IndicatorEngine::clearScalarCache() {
  scalarCache_.clear();
}

void IndicatorEngine::setMaxCacheEntries(std::size_t n) {
  maxEntries_ = n > 0 ? n : 1;
  evictLeastRecent(cache_, maxEntries_);
  evictLeastRecent(scalarCache_, maxEntries_);
}

} // namespace vc
