#pragma once
#include "vc/viewport/InputState.hpp"
#include "vc/viewport/ViewportManager.hpp"

namespace vc {

// Keyboard navigation + zoom-to-fit over a ViewportManager.
struct ZoomControllerConfig {
  double panFraction{0.1};     // arrow keys: pan by 10% of the visible span
  double zoomFactor{1.25};     // +/-: zoom by 25% at the centre
  double fitMargin{0.02};      // 2% margin on zoom-to-fit
};

class ZoomController {
public:
  void setConfig(const ZoomControllerConfig& cfg) { config_ = cfg; }

  // Returns true if the visible range changed.
  bool processKey(KeyCode key, ViewportManager& vm) const;

  // Shows every loaded bar (clamped to the maximum span).
  bool zoomToFit(ViewportManager& vm) const;

  static bool panByFraction(ViewportManager& vm, double fraction);
  // Moves the window so it starts at the first bar, keeping the span.
  static bool jumpToStart(ViewportManager& vm);
  // Moves the window so it ends at the last bar, keeping the span.
  static bool jumpToEnd(ViewportManager& vm);

private:
  ZoomControllerConfig config_;
};

} // namespace vc
