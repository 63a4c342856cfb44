#pragma once
#include "vc/axis/PriceAxis.hpp"
#include "vc/axis/TimeAxis.hpp"
#include "vc/config/EngineConfig.hpp"
#include "vc/indicators/IndicatorEngine.hpp"
#include "vc/layout/LabelCollision.hpp"
#include "vc/viewport/ViewportManager.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vc {

struct IndicatorRequest {
  std::string id;
  IndicatorParams params;
};

// Everything a renderer needs for one viewport revision.
struct FrameResult {
  std::uint64_t revision{0};
  bool viewportChanged{false};

  TimeAxisResult timeAxis;
  PriceAxisResult priceAxis;     // tick pixels follow the viewport's price mapping
  CollisionResult timeLabels;
  CollisionResult priceLabels;

  BarSeries bars;                // visible bars at the current LOD
  std::vector<IndicatorOutcome> indicators;   // one per request, over the visible bars
};

class ChartSession {
public:
  explicit ChartSession(const EngineConfig& cfg = EngineConfig{});

  const EngineConfig& config() const { return config_; }
  ViewportManager& viewport() { return viewport_; }
  const ViewportManager& viewport() const { return viewport_; }
  IndicatorEngine& indicators() { return engine_; }

  // Returns the request index (its slot in FrameResult::indicators).
  std::size_t addIndicator(const std::string& id, const IndicatorParams& params = IndicatorParams{});
  void clearIndicators();

  // Rebuilds the frame when the viewport revision moved (or the indicator set
  // changed); otherwise returns the previous frame with viewportChanged false.
  const FrameResult& update();
  const FrameResult& lastFrame() const { return frame_; }

private:
  void rebuild();

  EngineConfig config_;
  ViewportManager viewport_;
  IndicatorEngine engine_;
  std::vector<IndicatorRequest> requests_;

  FrameResult frame_;
  bool dirty_{true};
};

} // namespace vc
