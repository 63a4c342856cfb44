// D2.4: inertial pan, smooth wheel zoom, keyboard navigation and input mapping

#include "vc/axis/TimeFormat.hpp"
#include "vc/viewport/FrameScheduler.hpp"
#include "vc/viewport/InputMapper.hpp"
#include "vc/viewport/ViewportManager.hpp"
#include "vc/viewport/ZoomController.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static vc::BarSeries makeDailyBars(int count) {
  vc::BarSeries bars;
  vc::TimeMs t = vc::fromCivil(2019, 1, 1);
  for (int i = 0; i < count; ++i) {
    vc::PriceBar b;
    b.timestamp = t + i * vc::kDayMs;
    b.open = 100.0 + std::sin(i * 0.1) * 10.0;
    b.close = b.open + 1.0;
    b.high = b.close + 0.5;
    b.low = b.open - 0.5;
    b.volume = 1000.0;
    bars.push_back(b);
  }
  return bars;
}

int main() {
  using namespace vc;
  const BarSeries bars = makeDailyBars(1000);
  const TimeMs mid = bars[500].timestamp;

  // ---- Test 1: fling decays to a stop ----
  {
    ManualFrameScheduler sched;
    ViewportManager vm;
    vm.setScheduler(&sched);
    vm.setData(bars);
    vm.setVisibleTimeRange(static_cast<double>(mid - 60 * kDayMs),
                           static_cast<double>(mid + 60 * kDayMs));

    vm.startPan(400, 0);
    requireTrue(vm.isPanning(), "panning");
    requireTrue(vm.updatePan(410, 10), "drag step 1");
    requireTrue(vm.updatePan(420, 20), "drag step 2");
    TimeMs released = vm.getState().startTime;
    vm.endPan(25);
    requireTrue(!vm.isPanning(), "released");
    requireTrue(vm.isAnimating(), "momentum scheduled");
    requireTrue(sched.pendingCount() == 1, "one frame queued");

    TimeMs prev = released;
    int frames = 0;
    while (sched.pendingCount() > 0 && frames < 1000) {
      sched.runFrame();
      requireTrue(vm.getState().startTime <= prev, "momentum keeps the drag direction");
      prev = vm.getState().startTime;
      ++frames;
    }
    requireTrue(frames > 10 && frames < 200, "decays in a bounded number of frames");
    requireTrue(!vm.isAnimating(), "momentum finished");
    requireTrue(vm.getState().startTime < released, "coasted past the release point");
    requireTrue(vm.stats().framesScheduled == static_cast<std::uint64_t>(frames),
                "one frame per step");
    std::printf("  Test 1 (momentum): PASS (%d frames)\n", frames);
  }

  // ---- Test 2: slow release and missing scheduler do not fling ----
  {
    ManualFrameScheduler sched;
    ViewportManager vm;
    vm.setScheduler(&sched);
    vm.setData(bars);
    vm.setVisibleTimeRange(static_cast<double>(mid - 60 * kDayMs),
                           static_cast<double>(mid + 60 * kDayMs));
    vm.startPan(400, 0);
    vm.updatePan(430, 10);
    vm.endPan(500);
    requireTrue(sched.pendingCount() == 0, "held still before release");

    ViewportManager plain;
    plain.setData(bars);
    plain.setVisibleTimeRange(static_cast<double>(mid - 60 * kDayMs),
                              static_cast<double>(mid + 60 * kDayMs));
    plain.startPan(400, 0);
    plain.updatePan(440, 10);
    plain.endPan(12);
    requireTrue(!plain.isAnimating(), "no scheduler, no momentum");
    requireTrue(!plain.updatePan(500, 20), "update after release ignored");
    std::printf("  Test 2 (no fling): PASS\n");
  }

  // ---- Test 3: smooth wheel zoom converges on the target ----
  {
    ManualFrameScheduler sched;
    ViewportManager vm;
    vm.setScheduler(&sched);
    vm.setData(bars);
    vm.setVisibleTimeRange(static_cast<double>(mid - 60 * kDayMs),
                           static_cast<double>(mid + 60 * kDayMs));
    double span0 = static_cast<double>(vm.getState().endTime - vm.getState().startTime);
    double anchorTime = vm.pixelToTime(300);

    // Two notches before the first frame accumulate into one target.
    vm.wheelZoom(300, -250);
    vm.wheelZoom(300, -250);
    requireTrue(sched.pendingCount() == 1, "single animation in flight");
    std::size_t frames = sched.runUntilIdle();
    requireTrue(frames > 5, "eased over several frames");

    double span = static_cast<double>(vm.getState().endTime - vm.getState().startTime);
    double target = span0 / std::exp(500 * vm.config().wheelSensitivity);
    requireClose(span / target, 1.0, 2e-3, "span reaches the target");
    requireClose(vm.timeToPixel(anchorTime), 300.0, 1.0, "anchor held during easing");
    requireTrue(!vm.isAnimating(), "animation finished");
    std::printf("  Test 3 (wheel zoom): PASS (%zu frames)\n", frames);
  }

  // ---- Test 3b: smooth zoom on a minute-scale window reaches its target ----
  {
    ManualFrameScheduler sched;
    ViewportManager vm;
    vm.setScheduler(&sched);
    vm.setData(bars);
    vm.setVisibleTimeRange(static_cast<double>(mid),
                           static_cast<double>(mid + 30 * kMinuteMs));
    double span0 = static_cast<double>(vm.getState().endTime - vm.getState().startTime);
    requireClose(span0, static_cast<double>(30 * kMinuteMs), 0, "half-hour window");

    vm.wheelZoom(400, -100);
    std::size_t frames = sched.runUntilIdle();
    double span = static_cast<double>(vm.getState().endTime - vm.getState().startTime);
    double target = span0 / std::exp(100 * vm.config().wheelSensitivity);
    requireClose(span / target, 1.0, 2e-3, "short span eases all the way in");
    requireTrue(!vm.isAnimating(), "animation finished");

    // Direct zoom keeps its one-second floor.
    TimeMs before = vm.getState().endTime - vm.getState().startTime;
    requireTrue(!vm.zoomAt(400, 1.0001), "sub-second direct zoom ignored");
    requireTrue(vm.getState().endTime - vm.getState().startTime == before, "span unchanged");
    std::printf("  Test 3b (minute-scale wheel zoom): PASS (%zu frames)\n", frames);
  }

  // ---- Test 4: cancellation on stop and teardown ----
  {
    ManualFrameScheduler sched;
    ViewportManager vm;
    vm.setScheduler(&sched);
    vm.setData(bars);
    vm.wheelZoom(400, 300);
    requireTrue(sched.pendingCount() == 1, "zoom queued");
    vm.stopAnimations();
    requireTrue(sched.pendingCount() == 0, "stop cancels the frame");
    requireTrue(!vm.isAnimating(), "idle");

    auto owned = std::unique_ptr<ViewportManager>(new ViewportManager());
    owned->setScheduler(&sched);
    owned->setData(bars);
    owned->wheelZoom(400, -300);
    requireTrue(sched.pendingCount() == 1, "queued before teardown");
    owned.reset();
    requireTrue(sched.pendingCount() == 0, "teardown cancels pending frames");
    requireTrue(sched.runFrame() == 0, "nothing left to run");

    ViewportManager direct;
    direct.setData(bars);
    TimeMs span0 = direct.getState().endTime - direct.getState().startTime;
    direct.wheelZoom(400, -100);
    requireTrue(direct.getState().endTime - direct.getState().startTime < span0,
                "no scheduler: zoom applied at once");
    std::printf("  Test 4 (cancellation): PASS\n");
  }

  // ---- Test 5: keyboard navigation ----
  {
    ViewportManager vm;
    vm.setData(bars);
    ZoomController zc;

    TimeMs s0 = vm.getState().startTime;
    requireTrue(zc.processKey(KeyCode::Left, vm), "left arrow");
    requireTrue(vm.getState().startTime < s0, "moved earlier");

    requireTrue(zc.processKey(KeyCode::Fit, vm), "fit");
    const ViewportState& s = vm.getState();
    requireTrue(s.startTime < bars.front().timestamp && s.endTime > bars.back().timestamp,
                "fit shows every bar with a margin");
    requireTrue(s.visibleRange.size() == bars.size(), "all bars visible");

    requireTrue(zc.processKey(KeyCode::ZoomIn, vm), "zoom in");
    requireTrue(zc.processKey(KeyCode::Home, vm), "home");
    requireTrue(vm.getState().startTime == bars.front().timestamp, "starts at first bar");
    requireTrue(zc.processKey(KeyCode::End, vm), "end");
    requireTrue(vm.getState().endTime == bars.back().timestamp, "ends at last bar");
    requireTrue(!zc.processKey(KeyCode::Right, vm), "cannot move past the last bar");
    requireTrue(!zc.processKey(KeyCode::None, vm), "no key");

    ViewportManager empty;
    requireTrue(!zc.zoomToFit(empty), "fit without data");
    std::printf("  Test 5 (keys): PASS\n");
  }

  // ---- Test 6: input snapshots drive the manager ----
  {
    ManualFrameScheduler sched;
    ViewportManager vm;
    vm.setScheduler(&sched);
    vm.setData(bars);
    vm.setVisibleTimeRange(static_cast<double>(mid - 60 * kDayMs),
                           static_cast<double>(mid + 60 * kDayMs));

    InputMapperConfig mc;
    mc.enableMomentum = false;
    InputMapper mapper;
    mapper.setConfig(mc);

    ViewportInputState in;
    in.cursorX = 400;
    in.cursorY = 200;
    in.pointerDown = true;
    in.timeMs = 0;
    mapper.processInput(in, vm);
    requireTrue(mapper.dragging(), "press inside starts a drag");

    in.cursorX = 450;
    in.timeMs = 16;
    requireTrue(mapper.processInput(in, vm), "drag moves the window");

    in.pointerDown = false;
    in.timeMs = 32;
    mapper.processInput(in, vm);
    requireTrue(!mapper.dragging(), "release ends the drag");
    requireTrue(sched.pendingCount() == 0, "momentum disabled");

    ViewportInputState outside;
    outside.cursorX = -5;
    outside.cursorY = 200;
    outside.wheelDeltaY = 120;
    requireTrue(!mapper.processInput(outside, vm), "wheel outside the surface ignored");
    outside.pointerDown = true;
    mapper.processInput(outside, vm);
    requireTrue(!mapper.dragging(), "press outside does not drag");

    ViewportInputState key;
    key.keyPressed = KeyCode::ZoomIn;
    requireTrue(mapper.processInput(key, vm), "key routed to the zoom controller");
    std::printf("  Test 6 (input mapper): PASS\n");
  }

  std::printf("D2.4 viewport animation: ALL PASS\n");
  return 0;
}
