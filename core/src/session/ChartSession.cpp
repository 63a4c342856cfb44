#include "vc/session/ChartSession.hpp"

#include <cstdio>
#include <utility>

namespace vc {

ChartSession::ChartSession(const EngineConfig& cfg)
  : config_(cfg), viewport_(cfg.viewport) {
  engine_.setDebug(cfg.viewport.debug);
  engine_.setMaxCacheEntries(cfg.indicatorCacheEntries);
}

std::size_t ChartSession::addIndicator(const std::string& id, const IndicatorParams& params) {
  requests_.push_back({id, params});
  dirty_ = true;
  return requests_.size() - 1;
}

void ChartSession::clearIndicators() {
  requests_.clear();
  dirty_ = true;
}

const FrameResult& ChartSession::update() {
  const ViewportState& st = viewport_.getState();
  if (!dirty_ && st.revision == frame_.revision) {
    frame_.viewportChanged = false;
    return frame_;
  }
  rebuild();
  dirty_ = false;
  return frame_;
}

void ChartSession::rebuild() {
  const ViewportState& st = viewport_.getState();
  FrameResult f;
  f.revision = st.revision;
  f.viewportChanged = true;

  f.timeAxis = computeTimeAxis(st.startTime, st.endTime, st.width, config_.timeAxis);

  // Price ticks are placed with the viewport mapping so labels line up with
  // the bars; ticks that land off the surface are dropped.
  PriceAxisResult price = computePriceAxis(st.priceMin, st.priceMax, st.height,
                                           config_.priceAxis.minTickSpacingPx,
                                           config_.priceAxis.mode);
  std::vector<AxisTick> onSurface;
  for (auto t : price.ticks) {
    t.pixel = viewport_.priceToY(t.position);
    if (t.pixel >= 0 && t.pixel <= st.height) onSurface.push_back(std::move(t));
  }
  price.ticks = std::move(onSurface);
  f.priceAxis = std::move(price);

  const double font = config_.labelFontSize;
  f.timeLabels = resolveAdaptive(labelBoxesFromTimeTicks(f.timeAxis.ticks, font, st.height),
                                 config_.collision);
  f.priceLabels = resolveLabels(labelBoxesFromPriceTicks(f.priceAxis.ticks, font, st.width),
                                config_.collision.minSpacingPx);

  f.bars = viewport_.getProcessedVisibleData();

  BarSeries visible = viewport_.getVisibleData();
  f.indicators.reserve(requests_.size());
  for (const auto& req : requests_) {
    f.indicators.push_back(engine_.calculate(req.id, visible, req.params));
  }

  if (config_.viewport.debug.logRange) {
    std::fprintf(stderr, "[ChartSession] rev %llu: %zu time ticks (%zu shown), "
                 "%zu price ticks (%zu shown)\n",
                 static_cast<unsigned long long>(f.revision),
                 f.timeAxis.ticks.size(), f.timeLabels.visible.size(),
                 f.priceAxis.ticks.size(), f.priceLabels.visible.size());
  }
  frame_ = std::move(f);
}

} // namespace vc
