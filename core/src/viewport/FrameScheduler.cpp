#include "vc/viewport/FrameScheduler.hpp"
#include <algorithm>
#include <utility>

namespace vc {

FrameId ManualFrameScheduler::requestFrame(std::function<void()> cb) {
  FrameId id = nextId_++;
  queue_.push_back({id, std::move(cb)});
  return id;
}

void ManualFrameScheduler::cancelFrame(FrameId id) {
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (it->id == id) {
      queue_.erase(it);
      return;
    }
  }
  cancelledInBatch_.push_back(id);
}

std::size_t ManualFrameScheduler::runFrame() {
  std::vector<Entry> batch;
  batch.swap(queue_);
  cancelledInBatch_.clear();
  std::size_t ran = 0;
  for (auto& e : batch) {
    if (std::find(cancelledInBatch_.begin(), cancelledInBatch_.end(), e.id) !=
        cancelledInBatch_.end()) continue;
    if (e.cb) e.cb();
    ++ran;
  }
  cancelledInBatch_.clear();
  return ran;
}

std::size_t ManualFrameScheduler::runUntilIdle(std::size_t maxFrames) {
  std::size_t frames = 0;
  while (!queue_.empty() && frames < maxFrames) {
    runFrame();
    ++frames;
  }
  return frames;
}

} // namespace vc
