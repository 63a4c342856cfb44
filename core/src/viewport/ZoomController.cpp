#include "vc/viewport/ZoomController.hpp"

#include <cmath>

namespace vc {

bool ZoomController::processKey(KeyCode key, ViewportManager& vm) const {
  const ViewportState& s = vm.getState();
  switch (key) {
    case KeyCode::Left:
      return panByFraction(vm, -config_.panFraction);
    case KeyCode::Right:
      return panByFraction(vm, config_.panFraction);
    case KeyCode::ZoomIn:
      return vm.zoomAt(s.width * 0.5, config_.zoomFactor);
    case KeyCode::ZoomOut:
      return vm.zoomAt(s.width * 0.5, 1.0 / config_.zoomFactor);
    case KeyCode::Home:
      return jumpToStart(vm);
    case KeyCode::End:
      return jumpToEnd(vm);
    case KeyCode::Fit:
      return zoomToFit(vm);
    case KeyCode::None:
    default:
      return false;
  }
}

bool ZoomController::zoomToFit(ViewportManager& vm) const {
  const ViewportState& s = vm.getState();
  if (s.totalBars == 0) return false;

  double range = static_cast<double>(s.dataMaxTime - s.dataMinTime);
  if (range <= 0) range = static_cast<double>(vm.config().minTimeSpan);
  double margin = range * config_.fitMargin;

  return vm.setVisibleTimeRange(static_cast<double>(s.dataMinTime) - margin,
                                static_cast<double>(s.dataMaxTime) + margin);
}

bool ZoomController::panByFraction(ViewportManager& vm, double fraction) {
  const ViewportState& s = vm.getState();
  double span = static_cast<double>(s.endTime - s.startTime);
  return vm.panByTime(std::llround(span * fraction));
}

bool ZoomController::jumpToStart(ViewportManager& vm) {
  const ViewportState& s = vm.getState();
  if (s.totalBars == 0) return false;
  TimeMs span = s.endTime - s.startTime;
  return vm.setVisibleTimeRange(static_cast<double>(s.dataMinTime),
                                static_cast<double>(s.dataMinTime + span));
}

bool ZoomController::jumpToEnd(ViewportManager& vm) {
  const ViewportState& s = vm.getState();
  if (s.totalBars == 0) return false;
  TimeMs span = s.endTime - s.startTime;
  return vm.setVisibleTimeRange(static_cast<double>(s.dataMaxTime - span),
                                static_cast<double>(s.dataMaxTime));
}

} // namespace vc
