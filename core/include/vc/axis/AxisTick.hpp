#pragma once
#include <string>

namespace vc {

struct AxisTick {
  double position{0};       // epoch ms for time ticks, price for price ticks
  double pixel{0};          // x (time) or y (price) on the drawing surface
  std::string label;
  bool isMajor{false};
  bool isKeyBoundary{false};
};

} // namespace vc
