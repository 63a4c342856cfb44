#pragma once
#include "vc/axis/PriceAxis.hpp"
#include "vc/axis/TimeAxis.hpp"
#include "vc/core/Error.hpp"
#include "vc/layout/LabelCollision.hpp"
#include "vc/viewport/ViewportManager.hpp"

#include <cstddef>
#include <string>

namespace vc {

struct PriceAxisConfig {
  double minTickSpacingPx{50.0};
  ScaleMode mode{ScaleMode::Linear};
};

// Every tunable of the core in one record.
struct EngineConfig {
  ViewportConfig viewport;     // includes LOD tiers and debug toggles
  TimeAxisConfig timeAxis;
  PriceAxisConfig priceAxis;
  CollisionConfig collision;
  double labelFontSize{11.0};
  std::size_t indicatorCacheEntries{256};   // per engine cache, LRU beyond this
};

// Keys absent from `json` keep the values already in `out`. Unknown keys are
// ignored; a present key of the wrong type or an invalid value fails with
// BAD_CONFIG and leaves `out` untouched.
bool parseEngineConfig(const std::string& json, EngineConfig& out, Error& err);
std::string serializeEngineConfig(const EngineConfig& cfg);

// Rejects inconsistent values (min span > max span, empty LOD table, ...).
bool validateEngineConfig(const EngineConfig& cfg, Error& err);

} // namespace vc
