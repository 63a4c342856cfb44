#pragma once
#include <cstdint>

namespace vc {

enum class KeyCode : std::uint8_t {
  None = 0, Left, Right, ZoomIn, ZoomOut, Home, End, Fit
};

// Generic input snapshot, independent of any windowing toolkit.
struct ViewportInputState {
  double cursorX{0}, cursorY{0};  // pixels, 0=left/top
  double timeMs{0};               // host timestamp of this snapshot
  bool pointerDown{false};
  double wheelDeltaY{0};          // positive = scroll down (zoom out)
  KeyCode keyPressed{KeyCode::None};
};

struct InputMapperConfig {
  bool enableMomentum{true};
  bool enableWheelZoom{true};
};

} // namespace vc
