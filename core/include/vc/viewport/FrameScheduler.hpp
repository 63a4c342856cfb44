#pragma once
#include <cstdint>
#include <functional>
#include <vector>

namespace vc {

using FrameId = std::uint64_t;

// "Schedule next step" primitive. Hosts wrap their display loop
// (vsync callback, timer) behind this.
class FrameScheduler {
public:
  virtual ~FrameScheduler() = default;
  virtual FrameId requestFrame(std::function<void()> cb) = 0;
  virtual void cancelFrame(FrameId id) = 0;
};

// Queue driven explicitly by the caller.
class ManualFrameScheduler : public FrameScheduler {
public:
  FrameId requestFrame(std::function<void()> cb) override;
  void cancelFrame(FrameId id) override;

  // Runs the callbacks queued before this call. Returns how many ran.
  std::size_t runFrame();
  // Runs frames until the queue drains or `maxFrames` frames ran.
  std::size_t runUntilIdle(std::size_t maxFrames = 10000);

  std::size_t pendingCount() const { return queue_.size(); }

private:
  struct Entry {
    FrameId id;
    std::function<void()> cb;
  };
  std::vector<Entry> queue_;
  std::vector<FrameId> cancelledInBatch_;   // cancelled while a batch runs
  FrameId nextId_{1};
};

} // namespace vc
