#include "vc/viewport/InputMapper.hpp"

namespace vc {

bool InputMapper::processInput(const ViewportInputState& input, ViewportManager& vm) {
  std::uint64_t before = vm.getState().revision;
  const ViewportState& s = vm.getState();
  bool inside = input.cursorX >= 0 && input.cursorX <= s.width &&
                input.cursorY >= 0 && input.cursorY <= s.height;

  // Drag
  if (input.pointerDown && !dragging_) {
    if (inside) {
      vm.startPan(input.cursorX, input.timeMs);
      dragging_ = true;
    }
  } else if (input.pointerDown && dragging_) {
    vm.updatePan(input.cursorX, input.timeMs);
  } else if (!input.pointerDown && dragging_) {
    vm.updatePan(input.cursorX, input.timeMs);
    vm.endPan(input.timeMs);
    if (!config_.enableMomentum) vm.stopAnimations();
    dragging_ = false;
  }

  // Zoom
  if (config_.enableWheelZoom && input.wheelDeltaY != 0 && inside) {
    vm.wheelZoom(input.cursorX, input.wheelDeltaY);
  }

  if (input.keyPressed != KeyCode::None) {
    zoom_.processKey(input.keyPressed, vm);
  }

  return vm.getState().revision != before;
}

} // namespace vc
