// Axis demo: drives a ChartSession over a synthetic daily history and prints
// the axes, label layout, indicators and risk metrics for a few interactions.
//
// Usage: vc_axis_demo [config.json]

#include "vc/axis/TimeFormat.hpp"
#include "vc/data/SyntheticBarLoader.hpp"
#include "vc/session/ChartSession.hpp"
#include "vc/viewport/FrameScheduler.hpp"
#include "vc/viewport/InputMapper.hpp"
#include "vc/viewport/Timeframe.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

// ---- Helpers ----

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static const char* separatorName(vc::SeparatorType t) {
  switch (t) {
    case vc::SeparatorType::Day: return "day";
    case vc::SeparatorType::Month: return "month";
    case vc::SeparatorType::Quarter: return "quarter";
    case vc::SeparatorType::Year: return "year";
    case vc::SeparatorType::Decade: return "decade";
  }
  return "?";
}

static double lastValue(const std::vector<double>& col) {
  for (auto it = col.rbegin(); it != col.rend(); ++it) {
    if (!std::isnan(*it)) return *it;
  }
  return std::nan("");
}

static void printFrame(const char* title, vc::ChartSession& session) {
  const vc::FrameResult& f = session.update();
  const vc::ViewportState& st = session.viewport().getState();
  vc::TimeAxisSummary sum = session.viewport().getTimeAxisSummary();

  std::printf("\n== %s (rev %llu%s) ==\n", title,
              static_cast<unsigned long long>(f.revision),
              f.viewportChanged ? "" : ", cached");
  std::printf("  window   %s .. %s  (%s, %zu bars, timeframe %s, LOD %d)\n",
              sum.startLabel.c_str(), sum.endLabel.c_str(), sum.durationLabel.c_str(),
              sum.barCount, st.timeframe.c_str(), st.lodLevel);

  std::printf("  time     step %s:", f.timeAxis.granularity.c_str());
  for (const auto& l : f.timeLabels.visible) {
    std::printf(" %s", f.timeAxis.ticks[l.id].label.c_str());
  }
  std::printf("  (%zu hidden, spacing %.0fpx)\n", f.timeLabels.hidden.size(),
              f.timeLabels.spacing);
  if (!f.timeAxis.separators.empty()) {
    const vc::TimeSeparator& s = f.timeAxis.separators.front();
    std::printf("  seps     %zu, first %s '%s' at %.0fpx\n", f.timeAxis.separators.size(),
                separatorName(s.type), s.label.c_str(), s.pixel);
  }

  std::printf("  price    %.2f..%.2f step %g:", f.priceAxis.niceMin, f.priceAxis.niceMax,
              f.priceAxis.step);
  for (const auto& l : f.priceLabels.visible) {
    const vc::AxisTick& t = f.priceAxis.ticks[l.id];
    std::printf(" %s%s", t.label.c_str(), t.isMajor ? "*" : "");
  }
  std::printf("\n");

  for (const auto& o : f.indicators) {
    if (!o.ok) {
      std::printf("  %-8s error %s: %s\n", "", o.err.code.c_str(), o.err.message.c_str());
      continue;
    }
    std::printf("  %-8s", o.result->id.c_str());
    for (std::size_t p = 0; p < o.result->plots.size(); ++p) {
      std::printf(" %s=%.3f", o.result->plots[p].c_str(), lastValue(o.result->values[p]));
    }
    std::printf("%s\n", o.fromCache ? " (cached)" : "");
  }
}

// ---- Main ----

int main(int argc, char** argv) {
  vc::EngineConfig cfg;
  if (argc > 1) {
    std::string json;
    vc::Error err;
    if (!readFile(argv[1], json)) {
      std::fprintf(stderr, "[Demo] cannot read %s\n", argv[1]);
      return 1;
    }
    if (!vc::parseEngineConfig(json, cfg, err)) {
      std::fprintf(stderr, "[Demo] %s: %s\n", err.code.c_str(), err.message.c_str());
      return 1;
    }
  }

  const vc::TimeMs end = vc::fromCivil(2024, 6, 28);
  vc::SyntheticBarLoaderConfig lc;
  lc.earliestTime = vc::fromCivil(2015, 1, 1);
  lc.latestTime = end;
  vc::SyntheticBarLoader loader(lc);

  vc::ChartSession session(cfg);
  vc::ManualFrameScheduler scheduler;
  vc::ViewportManager& vm = session.viewport();
  vm.resize(1200, 480);
  vm.setScheduler(&scheduler);
  vm.setData(loader.generateHistory(end, 500));
  vm.setLoader(&loader);
  vm.setOnLoadError([](vc::LoadDirection, const std::string& msg) {
    std::fprintf(stderr, "[Demo] load failed: %s\n", msg.c_str());
  });

  session.addIndicator("MA", vc::IndicatorParams().set("period", 20));
  session.addIndicator("MACD");
  session.addIndicator("RSI");
  session.addIndicator("BOLL");

  printFrame("default", session);
  printFrame("again", session);

  for (const char* preset : {"5D", "1M", "1Y", "5Y"}) {
    if (!vm.applyTimeframe(preset)) {
      std::fprintf(stderr, "[Demo] timeframe %s rejected\n", preset);
      continue;
    }
    printFrame(preset, session);
  }

  // Mouse: wheel in at the centre, then a fast drag to the right.
  vc::InputMapper input;
  vc::ViewportInputState in;
  in.cursorX = 600;
  in.cursorY = 200;
  in.wheelDeltaY = -240;
  input.processInput(in, vm);
  std::size_t zoomFrames = scheduler.runUntilIdle();
  printFrame("wheel zoom", session);
  std::printf("  (%zu animation frames)\n", zoomFrames);

  in.wheelDeltaY = 0;
  in.pointerDown = true;
  for (int i = 0; i < 6; ++i) {
    in.timeMs = 1000.0 + i * 16.0;
    in.cursorX = 600.0 + i * 24.0;
    input.processInput(in, vm);
  }
  in.pointerDown = false;
  in.timeMs += 16.0;
  input.processInput(in, vm);
  std::size_t flingFrames = scheduler.runUntilIdle();
  printFrame("drag + momentum", session);
  std::printf("  (%zu animation frames)\n", flingFrames);

  in.keyPressed = vc::KeyCode::Home;
  input.processInput(in, vm);
  std::size_t delivered = loader.pump();
  printFrame("home", session);
  std::printf("  loads: %u left, %u right, %zu delivered, %zu bars total\n",
              loader.leftRequests(), loader.rightRequests(), delivered, vm.allBars().size());

  // Risk metrics over the full close history.
  vc::ScalarInputs risk;
  for (const auto& b : vm.allBars()) risk.prices.push_back(b.close);
  std::printf("\n== risk over %zu closes ==\n", risk.prices.size());
  for (const char* id : {"SHARPE", "SORTINO", "MAX_DRAWDOWN", "CALMAR", "VAR"}) {
    vc::ScalarOutcome o = session.indicators().calculateScalar(id, risk);
    if (o.ok) {
      std::printf("  %-13s %.4f\n", id, o.value);
    } else {
      std::printf("  %-13s %s\n", id, o.err.message.c_str());
    }
  }

  const vc::IndicatorStats& s = session.indicators().stats();
  std::printf("\nindicator cache: %llu computed, %llu hits\n",
              static_cast<unsigned long long>(s.computations),
              static_cast<unsigned long long>(s.cacheHits));
  return 0;
}
