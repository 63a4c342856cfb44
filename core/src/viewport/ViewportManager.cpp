#include "vc/viewport/ViewportManager.hpp"
#include "vc/axis/TimeFormat.hpp"
#include "vc/data/BarAggregator.hpp"
#include "vc/math/Normalize.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <utility>

namespace vc {

static bool timeInRange(double t) {
  return std::isfinite(t) && std::fabs(t) <= static_cast<double>(kMaxTimeMs);
}

static const char* directionName(LoadDirection dir) {
  return dir == LoadDirection::Left ? "left" : "right";
}

ViewportManager::ViewportManager(const ViewportConfig& cfg)
    : config_(cfg), alive_(std::make_shared<int>(0)) {
  autoScale_.setConfig(config_.autoScale);
  lod_.setConfig(config_.lod);
  blocks_.setConfig(config_.blocks);
  state_.startTime = 0;
  state_.endTime = referenceSpan_;
  recomputeDerived();
}

ViewportManager::~ViewportManager() {
  stopAnimations();
  alive_.reset();
}

void ViewportManager::setLoader(DataLoader* loader) {
  // Requests already in flight still complete through their callbacks, so the
  // busy flags stay set until they land.
  loader_ = loader;
  leftExhausted_ = rightExhausted_ = false;
  recomputeDerived();
  checkLoad();
}

void ViewportManager::setScheduler(FrameScheduler* scheduler) {
  stopAnimations();
  scheduler_ = scheduler;
}

void ViewportManager::setClock(std::function<TimeMs()> clock) {
  clock_ = std::move(clock);
}

void ViewportManager::setOnChange(std::function<void(const ViewportState&)> cb) {
  onChange_ = std::move(cb);
}

void ViewportManager::setOnLoadError(
    std::function<void(LoadDirection, const std::string&)> cb) {
  onLoadError_ = std::move(cb);
}

TimeMs ViewportManager::now() const {
  if (clock_) return clock_();
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ---- Data ----

void ViewportManager::setData(BarSeries bars) {
  normalizeBars(bars);
  bars_ = std::move(bars);
  blocks_.clear();
  leftExhausted_ = rightExhausted_ = false;

  if (!applyTimeframe(config_.defaultTimeframe)) {
    if (!bars_.empty()) {
      applyRange(bars_.front().timestamp, bars_.back().timestamp, true);
    } else {
      recomputeDerived();
      notifyChange();
    }
  }
}

std::size_t ViewportManager::mergeBars(const BarSeries& bars) {
  std::size_t added = mergeBarSeries(bars_, bars);
  if (added == 0) return 0;
  stats_.barsMerged += added;
  leftExhausted_ = rightExhausted_ = false;
  blocks_.reindex(bars_);
  recomputeDerived();
  notifyChange();
  return added;
}

void ViewportManager::resize(double width, double height) {
  if (!(width > 0) || !(height > 0) || !std::isfinite(width) || !std::isfinite(height)) {
    ++stats_.rejectedMutations;
    return;
  }
  state_.width = width;
  state_.height = height;
  recomputeDerived();
  notifyChange();
}

// ---- Range mutation ----

void ViewportManager::clampSpan(TimeMs& start, TimeMs& end) const {
  TimeMs span = end - start;
  if (span < config_.minTimeSpan) {
    TimeMs center = start + span / 2;
    start = center - config_.minTimeSpan / 2;
    end = start + config_.minTimeSpan;
  } else if (span > config_.maxTimeSpan) {
    start = end - config_.maxTimeSpan;
  }
}

bool ViewportManager::applyRange(TimeMs start, TimeMs end, bool markCustom) {
  if (start < -kMaxTimeMs || end > kMaxTimeMs || start > end) {
    ++stats_.rejectedMutations;
    return false;
  }
  clampSpan(start, end);

  state_.startTime = start;
  state_.endTime = end;
  if (markCustom) state_.timeframe = kCustomTimeframe;

  recomputeDerived();
  blocks_.touch(start, end, now());
  ++stats_.rangeMutations;

  if (config_.debug.logRange) {
    std::fprintf(stderr, "[ViewportManager] range %s .. %s (%s) bars=%zu\n",
                 formatTime(start, "%Y-%m-%d %H:%M").c_str(),
                 formatTime(end, "%Y-%m-%d %H:%M").c_str(),
                 state_.timeframe.c_str(), state_.visibleRange.size());
  }

  if (loader_) loader_->onRangeChange(state_.visibleRange.start, state_.visibleRange.end);
  notifyChange();
  checkLoad();
  return true;
}

bool ViewportManager::setVisibleTimeRange(double start, double end) {
  if (!timeInRange(start) || !timeInRange(end) || start >= end) {
    ++stats_.rejectedMutations;
    return false;
  }
  return applyRange(std::llround(start), std::llround(end), true);
}

bool ViewportManager::applyTimeframe(const std::string& preset) {
  const TimeframePreset* p = findTimeframe(preset);
  if (!p) {
    std::fprintf(stderr, "[ViewportManager] unknown timeframe '%s'\n", preset.c_str());
    ++stats_.rejectedMutations;
    return false;
  }

  TimeMs end = bars_.empty() ? now() : bars_.back().timestamp;
  TimeMs start;
  if (p->name == "YTD") {
    start = startOfYear(end);
  } else if (p->name == "ALL") {
    start = bars_.empty() ? end - p->calendarSpan : bars_.front().timestamp;
  } else {
    start = tradingDaysBack(end, p->tradingDays);
  }

  TimeMs s = start, e = end;
  clampSpan(s, e);
  referenceSpan_ = e - s;
  state_.timeframe = p->name;
  state_.interval = p->interval;
  return applyRange(s, e, false);
}

bool ViewportManager::zoomAt(double anchorPixel, double factor) {
  return zoomBy(anchorPixel, factor, config_.negligibleSpanMs);
}

bool ViewportManager::zoomBy(double anchorPixel, double factor, double negligibleMs) {
  if (!std::isfinite(factor) || factor <= 0 || !std::isfinite(anchorPixel) ||
      state_.width <= 0) {
    ++stats_.rejectedMutations;
    return false;
  }

  double span = static_cast<double>(state_.endTime - state_.startTime);
  double newSpan = clampValue(span / factor,
                              static_cast<double>(config_.minTimeSpan),
                              static_cast<double>(config_.maxTimeSpan));
  if (std::fabs(newSpan - span) < negligibleMs) return false;

  double ratio = clampValue(anchorPixel / state_.width, 0.0, 1.0);
  double anchorTime = static_cast<double>(state_.startTime) + ratio * span;
  double newStart = anchorTime - ratio * newSpan;

  TimeMs s = std::llround(newStart);
  return applyRange(s, s + std::llround(newSpan), true);
}

bool ViewportManager::pan(double deltaPixels) {
  if (!std::isfinite(deltaPixels) || state_.width <= 0) {
    ++stats_.rejectedMutations;
    return false;
  }
  double span = static_cast<double>(state_.endTime - state_.startTime);
  double delta = -deltaPixels * span / state_.width;
  if (!timeInRange(delta)) {
    ++stats_.rejectedMutations;
    return false;
  }
  return panByTime(std::llround(delta));
}

bool ViewportManager::panByTime(TimeMs deltaMs) {
  if (deltaMs == 0) return false;
  if (deltaMs < -kMaxTimeMs || deltaMs > kMaxTimeMs) {
    ++stats_.rejectedMutations;
    return false;
  }

  TimeMs newStart = state_.startTime + deltaMs;
  TimeMs newEnd = state_.endTime + deltaMs;

  // Without a loader the window may not be pushed past the loaded data.
  if (!loader_ && !bars_.empty()) {
    if ((deltaMs < 0 && newStart < bars_.front().timestamp) ||
        (deltaMs > 0 && newEnd > bars_.back().timestamp)) {
      ++stats_.rejectedMutations;
      return false;
    }
  }
  return applyRange(newStart, newEnd, true);
}

// ---- Derived state ----

void ViewportManager::recomputeDerived() {
  const std::size_t n = bars_.size();
  state_.totalBars = n;
  state_.dataMinTime = n ? bars_.front().timestamp : 0;
  state_.dataMaxTime = n ? bars_.back().timestamp : 0;

  state_.visibleRange.start = lowerBoundIndex(bars_, state_.startTime);
  state_.visibleRange.end = upperBoundIndex(bars_, state_.endTime);
  if (state_.visibleRange.end < state_.visibleRange.start)
    state_.visibleRange.end = state_.visibleRange.start;

  if (!loader_) {
    state_.cachedRange = {0, n};
  } else {
    std::size_t visible = state_.visibleRange.size();
    auto extra = static_cast<std::size_t>(
        std::ceil(static_cast<double>(visible) * (config_.bufferRatio - 1.0) * 0.5));
    state_.cachedRange.start = state_.visibleRange.start > extra
        ? state_.visibleRange.start - extra : 0;
    state_.cachedRange.end = std::min(n, state_.visibleRange.end + extra);
  }

  double span = static_cast<double>(state_.endTime - state_.startTime);
  state_.pixelsPerMs = span > 0 ? state_.width / span : 0.0;
  state_.zoomLevel = span > 0 ? static_cast<double>(referenceSpan_) / span : 1.0;
  state_.barsPerPixel = state_.width > 0
      ? static_cast<double>(state_.visibleRange.size()) / state_.width : 0.0;

  const TimeframePreset* preset = findTimeframe(state_.timeframe);
  state_.axisLevel = preset ? preset->level
                            : levelForSpan(state_.endTime - state_.startTime);

  if (lod_.evaluate(state_.barsPerPixel)) {
    ++stats_.lodSwitches;
    if (config_.debug.logLod) {
      std::fprintf(stderr, "[ViewportManager] LOD -> %d (%s, x%u) at %.3f bars/px\n",
                   lod_.current().level, lod_.current().description.c_str(),
                   lod_.currentFactor(), state_.barsPerPixel);
    }
  }
  state_.lodLevel = lod_.current().level;

  // Y ranges follow the visible bars only; an empty window keeps the last ranges.
  if (state_.visibleRange.size() > 0) {
    const PriceBar* first = bars_.data() + state_.visibleRange.start;
    std::size_t count = state_.visibleRange.size();
    double lo, hi;
    if (autoScale_.computePriceRange(first, count, lo, hi)) {
      state_.priceMin = lo;
      state_.priceMax = hi;
    }
    if (autoScale_.computeVolumeRange(first, count, lo, hi)) {
      state_.volumeMin = lo;
      state_.volumeMax = hi;
    }
  }

  state_.isLoadingLeft = loadingLeft_;
  state_.isLoadingRight = loadingRight_;
  ++state_.revision;
}

void ViewportManager::notifyChange() {
  if (onChange_) onChange_(state_);
}

// ---- Loading ----

void ViewportManager::checkLoad() {
  if (!loader_ || bars_.empty()) return;

  if (state_.startTime - bars_.front().timestamp < config_.loadMargin)
    requestLoad(LoadDirection::Left);
  if (bars_.back().timestamp - state_.endTime < config_.loadMargin)
    requestLoad(LoadDirection::Right);
}

void ViewportManager::requestLoad(LoadDirection dir) {
  bool left = dir == LoadDirection::Left;
  if (left ? (loadingLeft_ || leftExhausted_) : (loadingRight_ || rightExhausted_))
    return;

  TimeMs anchor = left ? bars_.front().timestamp : bars_.back().timestamp;
  if (blocks_.isLoading(dir) || blocks_.hasRequested(dir, anchor)) {
    if (config_.debug.logLoads) {
      std::fprintf(stderr, "[ViewportManager] load %s from %s already requested\n",
                   directionName(dir), formatTime(anchor, "%Y-%m-%d %H:%M").c_str());
    }
    return;
  }

  std::size_t count = std::max(config_.loadBatchSize, state_.visibleRange.size());

  (left ? loadingLeft_ : loadingRight_) = true;
  (left ? state_.isLoadingLeft : state_.isLoadingRight) = true;
  std::uint32_t blockId = blocks_.beginLoad(dir, anchor, now());
  ++stats_.loadsIssued;

  if (config_.debug.logLoads) {
    std::fprintf(stderr, "[ViewportManager] load %s: %zu bars from %s\n",
                 directionName(dir), count,
                 formatTime(anchor, "%Y-%m-%d %H:%M").c_str());
  }

  std::weak_ptr<int> alive = alive_;
  LoadCallback done = [this, alive, dir, blockId](LoadResult result) {
    if (alive.expired()) return;
    onLoadComplete(dir, blockId, std::move(result));
  };

  if (left) loader_->loadMoreLeft(anchor, count, std::move(done));
  else      loader_->loadMoreRight(anchor, count, std::move(done));
}

void ViewportManager::onLoadComplete(LoadDirection dir, std::uint32_t blockId,
                                     LoadResult result) {
  bool left = dir == LoadDirection::Left;
  (left ? loadingLeft_ : loadingRight_) = false;

  if (!result.ok) {
    ++stats_.loadsFailed;
    lastLoadError_ = result.error;
    blocks_.failLoad(blockId);
    state_.isLoadingLeft = loadingLeft_;
    state_.isLoadingRight = loadingRight_;
    std::fprintf(stderr, "[ViewportManager] load %s failed: %s\n",
                 directionName(dir), result.error.c_str());
    if (onLoadError_) onLoadError_(dir, result.error);
    return;
  }

  std::size_t added = mergeBarSeries(bars_, result.bars);
  if (added == 0) (left ? leftExhausted_ : rightExhausted_) = true;

  blocks_.completeLoad(blockId, result.bars, now());
  blocks_.reindex(bars_);
  ++stats_.loadsMerged;
  stats_.barsMerged += added;

  if (config_.debug.logLoads) {
    std::fprintf(stderr, "[ViewportManager] load %s merged %zu bars (total %zu)\n",
                 directionName(dir), added, bars_.size());
  }

  recomputeDerived();
  notifyChange();
}

// ---- Animation ----

void ViewportManager::startPan(double x, double timeMs) {
  stopAnimations();
  panning_ = true;
  panLastX_ = x;
  panLastTime_ = timeMs;
  velocity_ = 0;
}

bool ViewportManager::updatePan(double x, double timeMs) {
  if (!panning_) return false;
  double dx = x - panLastX_;
  double dt = timeMs - panLastTime_;

  bool changed = dx != 0 && pan(dx);
  if (dt > 0) velocity_ = 0.8 * (dx / dt) + 0.2 * velocity_;

  panLastX_ = x;
  panLastTime_ = timeMs;
  return changed;
}

void ViewportManager::endPan(double timeMs) {
  if (!panning_) return;
  panning_ = false;

  // Pointer held still before release: no fling.
  if (timeMs - panLastTime_ > 100.0) velocity_ = 0;

  if (std::fabs(velocity_) > config_.momentumThreshold && scheduler_) {
    scheduleMomentum();
  } else {
    velocity_ = 0;
  }
}

void ViewportManager::scheduleMomentum() {
  momentumFrame_ = scheduler_->requestFrame([this] { momentumStep(); });
  ++stats_.framesScheduled;
}

void ViewportManager::momentumStep() {
  momentumFrame_ = 0;
  double offset = velocity_ * config_.frameMs;
  if (!pan(offset)) {
    velocity_ = 0;
    return;
  }
  velocity_ *= config_.momentumDecay;
  if (std::fabs(velocity_) < config_.momentumFloor) {
    velocity_ = 0;
    return;
  }
  scheduleMomentum();
}

void ViewportManager::wheelZoom(double anchorPixel, double deltaY) {
  if (!std::isfinite(deltaY) || !std::isfinite(anchorPixel) || deltaY == 0) return;
  double factor = std::exp(-deltaY * config_.wheelSensitivity);

  if (!scheduler_) {
    zoomAt(anchorPixel, factor);
    return;
  }

  if (zoomFrame_ == 0) {
    zoomCurrent_ = 1.0;
    zoomTarget_ = 1.0;
  }
  zoomTarget_ *= factor;
  zoomAnchor_ = anchorPixel;
  if (zoomFrame_ == 0) scheduleZoom();
}

void ViewportManager::scheduleZoom() {
  zoomFrame_ = scheduler_->requestFrame([this] { smoothZoomStep(); });
  ++stats_.framesScheduled;
}

void ViewportManager::smoothZoomStep() {
  zoomFrame_ = 0;
  double diff = zoomTarget_ - zoomCurrent_;
  if (std::fabs(diff) < config_.smoothZoomEpsilon) {
    zoomCurrent_ = zoomTarget_ = 1.0;
    return;
  }

  double next = zoomCurrent_ + diff * config_.smoothZoomFactor;
  // Eased steps shrink with the span, so only a step under the 1 ms time
  // resolution counts as negligible. A rejected step means the span hit its clamp.
  if (!zoomBy(zoomAnchor_, next / zoomCurrent_, 1.0)) {
    zoomCurrent_ = zoomTarget_ = 1.0;
    return;
  }
  zoomCurrent_ = next;
  scheduleZoom();
}

void ViewportManager::stopAnimations() {
  if (scheduler_) {
    if (momentumFrame_) scheduler_->cancelFrame(momentumFrame_);
    if (zoomFrame_) scheduler_->cancelFrame(zoomFrame_);
  }
  momentumFrame_ = 0;
  zoomFrame_ = 0;
  velocity_ = 0;
  zoomCurrent_ = zoomTarget_ = 1.0;
}

// ---- Mapping ----

double ViewportManager::timeToPixel(double t) const {
  return normalizeToRange(t, static_cast<double>(state_.startTime),
                          static_cast<double>(state_.endTime), 0.0, state_.width);
}

double ViewportManager::pixelToTime(double px) const {
  if (state_.width <= 0) return static_cast<double>(state_.startTime);
  return normalizeToRange(px, 0.0, state_.width,
                          static_cast<double>(state_.startTime),
                          static_cast<double>(state_.endTime));
}

double ViewportManager::priceToY(double price) const {
  return state_.height -
         normalizeToRange(price, state_.priceMin, state_.priceMax, 0.0, state_.height);
}

double ViewportManager::yToPrice(double y) const {
  if (state_.height <= 0) return state_.priceMin;
  return normalizeToRange(state_.height - y, 0.0, state_.height,
                          state_.priceMin, state_.priceMax);
}

double ViewportManager::volumeToY(double volume) const {
  return state_.height -
         normalizeToRange(volume, state_.volumeMin, state_.volumeMax, 0.0, state_.height);
}

// ---- Snapshots ----

BarSeries ViewportManager::getVisibleData() const {
  const auto& r = state_.visibleRange;
  return BarSeries(bars_.begin() + static_cast<std::ptrdiff_t>(r.start),
                   bars_.begin() + static_cast<std::ptrdiff_t>(r.start + r.size()));
}

BarSeries ViewportManager::getCachedData() const {
  const auto& r = state_.cachedRange;
  return BarSeries(bars_.begin() + static_cast<std::ptrdiff_t>(r.start),
                   bars_.begin() + static_cast<std::ptrdiff_t>(r.start + r.size()));
}

BarSeries ViewportManager::getProcessedVisibleData() const {
  const auto& r = state_.visibleRange;
  return aggregateBars(bars_.data() + r.start, r.size(), lod_.currentFactor());
}

TimeAxisSummary ViewportManager::getTimeAxisSummary() const {
  TimeAxisSummary s;
  s.startLabel = formatTime(state_.startTime, "%Y-%m-%d %H:%M");
  s.endLabel = formatTime(state_.endTime, "%Y-%m-%d %H:%M");
  s.durationLabel = formatDuration(state_.endTime - state_.startTime);
  s.barCount = state_.visibleRange.size();
  return s;
}

} // namespace vc
