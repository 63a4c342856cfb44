#pragma once
#include "vc/viewport/InputState.hpp"
#include "vc/viewport/ViewportManager.hpp"
#include "vc/viewport/ZoomController.hpp"

namespace vc {

// Turns per-frame input snapshots into ViewportManager operations:
// pointer drag -> startPan/updatePan/endPan, wheel -> wheelZoom,
// keys -> ZoomController.
class InputMapper {
public:
  void setConfig(const InputMapperConfig& cfg) { config_ = cfg; }
  void setZoomController(const ZoomController& zc) { zoom_ = zc; }

  // Returns true if the visible range changed during this call.
  bool processInput(const ViewportInputState& input, ViewportManager& vm);

  bool dragging() const { return dragging_; }

private:
  InputMapperConfig config_;
  ZoomController zoom_;
  bool dragging_{false};
};

} // namespace vc
