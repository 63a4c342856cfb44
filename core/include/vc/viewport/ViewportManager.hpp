#pragma once
#include "vc/data/DataBlockCache.hpp"
#include "vc/data/DataLoader.hpp"
#include "vc/data/LodPolicy.hpp"
#include "vc/data/PriceBar.hpp"
#include "vc/debug/Stats.hpp"
#include "vc/viewport/AutoScale.hpp"
#include "vc/viewport/FrameScheduler.hpp"
#include "vc/viewport/Timeframe.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vc {

struct ViewportConfig {
  TimeMs minTimeSpan{5 * kMinuteMs};
  TimeMs maxTimeSpan{3650 * kDayMs};
  TimeMs loadMargin{7 * kDayMs};       // edge proximity that triggers a load
  double negligibleSpanMs{1000.0};     // smaller zoom span changes are ignored
  double bufferRatio{2.0};             // cached window = visible * ratio
  std::size_t loadBatchSize{200};      // minimum bars per load request

  AutoScaleConfig autoScale;
  LodPolicyConfig lod;
  DataBlockCacheConfig blocks;

  // Inertial pan (velocity in pixels per millisecond)
  double momentumThreshold{0.3};
  double momentumFloor{0.01};
  double momentumDecay{0.92};
  double frameMs{16.0};

  // Smooth wheel zoom
  double wheelSensitivity{0.002};
  double smoothZoomFactor{0.15};
  double smoothZoomEpsilon{0.001};

  std::string defaultTimeframe{"3M"};
  DebugToggles debug;
};

constexpr const char* kCustomTimeframe = "Custom";

struct IndexRange {
  std::size_t start{0};
  std::size_t end{0};   // exclusive
  std::size_t size() const { return end > start ? end - start : 0; }
};

// Read-only snapshot handed to renderers.
struct ViewportState {
  TimeMs startTime{0};
  TimeMs endTime{0};
  IndexRange visibleRange;
  IndexRange cachedRange;

  std::string timeframe{kCustomTimeframe};
  std::string interval;
  TimeLevel axisLevel{TimeLevel::Day};

  double width{800};
  double height{400};
  double priceMin{0}, priceMax{1};
  double volumeMin{0}, volumeMax{1};

  double zoomLevel{1.0};
  double pixelsPerMs{0};
  double barsPerPixel{0};
  int lodLevel{0};

  TimeMs dataMinTime{0};
  TimeMs dataMaxTime{0};
  std::size_t totalBars{0};
  bool isLoadingLeft{false};
  bool isLoadingRight{false};
  std::uint64_t revision{0};
};

struct TimeAxisSummary {
  std::string startLabel;
  std::string endLabel;
  std::string durationLabel;
  std::size_t barCount{0};
};

// Owns the bar history and the visible time window over it. All mutation
// goes through this class; every entry point returns false when the request
// was rejected and leaves the state untouched in that case.
class ViewportManager {
public:
  explicit ViewportManager(const ViewportConfig& cfg = ViewportConfig{});
  ~ViewportManager();

  ViewportManager(const ViewportManager&) = delete;
  ViewportManager& operator=(const ViewportManager&) = delete;

  const ViewportConfig& config() const { return config_; }

  // Collaborators (not owned). Loader and scheduler must outlive the manager
  // or be detached first.
  void setLoader(DataLoader* loader);
  void setScheduler(FrameScheduler* scheduler);
  void setClock(std::function<TimeMs()> clock);
  void setOnChange(std::function<void(const ViewportState&)> cb);
  void setOnLoadError(std::function<void(LoadDirection, const std::string&)> cb);

  // Replaces the bar history. Applies the default timeframe.
  void setData(BarSeries bars);
  // Adds bars (duplicates keep the existing bar). Visible times are kept.
  std::size_t mergeBars(const BarSeries& bars);

  void resize(double width, double height);

  bool setVisibleTimeRange(double start, double end);
  bool applyTimeframe(const std::string& preset);

  bool zoomAt(double anchorPixel, double factor);
  bool pan(double deltaPixels);          // positive drags content right (earlier time)
  bool panByTime(TimeMs deltaMs);        // positive moves toward later time

  // Pointer drag with inertia. Times are host timestamps in ms.
  void startPan(double x, double timeMs);
  bool updatePan(double x, double timeMs);
  void endPan(double timeMs);
  bool isPanning() const { return panning_; }
  bool isAnimating() const { return momentumFrame_ != 0 || zoomFrame_ != 0; }

  // Smooth wheel zoom toward exp(-deltaY * sensitivity).
  void wheelZoom(double anchorPixel, double deltaY);

  // Cancels pending animation frames.
  void stopAnimations();

  // Coordinate mapping
  double timeToPixel(double t) const;
  double pixelToTime(double px) const;
  double priceToY(double price) const;
  double yToPrice(double y) const;
  double volumeToY(double volume) const;

  // Snapshots
  const ViewportState& getState() const { return state_; }
  const IndexRange& getVisibleRange() const { return state_.visibleRange; }
  const IndexRange& getCachedRange() const { return state_.cachedRange; }
  BarSeries getVisibleData() const;
  BarSeries getCachedData() const;
  BarSeries getProcessedVisibleData() const;
  const BarSeries& allBars() const { return bars_; }
  const LODLevel& getCurrentLOD() const { return lod_.current(); }
  TimeAxisSummary getTimeAxisSummary() const;

  const DataBlockCache& blocks() const { return blocks_; }
  const ViewportStats& stats() const { return stats_; }
  const std::string& lastLoadError() const { return lastLoadError_; }

private:
  bool applyRange(TimeMs start, TimeMs end, bool markCustom);
  bool zoomBy(double anchorPixel, double factor, double negligibleMs);
  void clampSpan(TimeMs& start, TimeMs& end) const;
  void recomputeDerived();
  void notifyChange();
  void checkLoad();
  void requestLoad(LoadDirection dir);
  void onLoadComplete(LoadDirection dir, std::uint32_t blockId, LoadResult result);

  void momentumStep();
  void smoothZoomStep();
  void scheduleMomentum();
  void scheduleZoom();

  TimeMs now() const;

  ViewportConfig config_;
  AutoScale autoScale_;
  LodController lod_;
  DataBlockCache blocks_;

  BarSeries bars_;
  ViewportState state_;
  TimeMs referenceSpan_{90 * kDayMs};

  DataLoader* loader_{nullptr};
  FrameScheduler* scheduler_{nullptr};
  std::function<TimeMs()> clock_;
  std::function<void(const ViewportState&)> onChange_;
  std::function<void(LoadDirection, const std::string&)> onLoadError_;

  bool loadingLeft_{false};
  bool loadingRight_{false};
  bool leftExhausted_{false};
  bool rightExhausted_{false};
  std::string lastLoadError_;

  // Loader callbacks hold a weak reference; expired means the manager is gone.
  std::shared_ptr<int> alive_;

  // Drag state
  bool panning_{false};
  double panLastX_{0};
  double panLastTime_{0};
  double velocity_{0};
  FrameId momentumFrame_{0};

  // Smooth zoom state
  double zoomCurrent_{1.0};
  double zoomTarget_{1.0};
  double zoomAnchor_{0};
  FrameId zoomFrame_{0};

  ViewportStats stats_;
};

} // namespace vc
