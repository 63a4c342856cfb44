// D4.1: label collision resolution (greedy, adaptive, critical, layered, helpers)

#include "vc/layout/LabelCollision.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

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

static vc::LabelBox box(std::size_t id, double x, double y, double w, double h,
                        bool major = false, int priority = 0) {
  vc::LabelBox b;
  b.id = id;
  b.x = x;
  b.y = y;
  b.width = w;
  b.height = h;
  b.isMajor = major;
  b.priority = priority;
  return b;
}

static void requireNoOverlap(const vc::CollisionResult& r, double spacing, const char* msg) {
  for (std::size_t i = 0; i < r.visible.size(); ++i) {
    for (std::size_t j = i + 1; j < r.visible.size(); ++j) {
      requireTrue(!vc::boxesOverlap(r.visible[i], r.visible[j], spacing), msg);
    }
  }
}

int main() {
  using namespace vc;

  // ---- Test 1: 20 overlapping labels at 8 px spacing ----
  {
    std::vector<LabelBox> labels;
    for (std::size_t i = 0; i < 20; ++i) {
      labels.push_back(box(i, static_cast<double>(i) * 20.0, 0, 60, 14, i % 5 == 0));
    }
    CollisionResult r = resolveLabels(labels, 8.0);
    requireTrue(r.visible.size() + r.hidden.size() == 20, "every label accounted for");
    requireTrue(r.collisionCount == r.hidden.size(), "collision count");
    requireTrue(r.density <= 1.0, "density capped");
    requireNoOverlap(r, 8.0, "no visible overlap");
    int majors = 0;
    for (const auto& l : r.visible) if (l.isMajor) ++majors;
    requireTrue(majors == 4, "majors placed first (x = 0, 100, 200, 300)");
    std::printf("  Test 1 (greedy): PASS (%zu shown)\n", r.visible.size());
  }

  // ---- Test 2: random layouts never leave visible overlaps ----
  {
    std::uint32_t state = 12345u;
    auto rnd = [&state]() {
      state = state * 1664525u + 1013904223u;
      return static_cast<double>(state >> 8) / 16777216.0;
    };
    for (int round = 0; round < 50; ++round) {
      std::vector<LabelBox> labels;
      int n = 5 + static_cast<int>(rnd() * 40);
      for (int i = 0; i < n; ++i) {
        labels.push_back(box(static_cast<std::size_t>(i), rnd() * 800, rnd() * 40,
                             10 + rnd() * 70, 10 + rnd() * 6, rnd() < 0.2,
                             static_cast<int>(rnd() * 10)));
      }
      double spacing = rnd() * 12;
      CollisionResult r = resolveLabels(labels, spacing);
      requireNoOverlap(r, spacing, "random: no visible overlap");
      requireTrue(r.density >= 0 && r.density <= 1.0, "random: density in [0, 1]");

      CollisionResult a = resolveAdaptive(labels);
      requireNoOverlap(a, a.spacing, "adaptive: no visible overlap");
      requireTrue(a.visible.size() + a.hidden.size() == labels.size(), "adaptive: all labels");
    }
    std::printf("  Test 2 (random property): PASS\n");
  }

  // ---- Test 3: adaptive spacing reacts to density ----
  {
    std::vector<LabelBox> dense;
    for (std::size_t i = 0; i < 10; ++i) dense.push_back(box(i, i * 40.0, 0, 36, 12));
    CollisionConfig cfg;
    const double start = cfg.minSpacingPx;   // 8 px minimum over the 4 px initial value
    CollisionResult r = resolveAdaptive(dense, cfg);
    requireTrue(r.spacing > start, "dense row grows the spacing");
    requireTrue(r.density <= cfg.targetDensity + 1e-9 || r.spacing >=
                start + (cfg.maxIterations - 1) * cfg.growStepPx,
                "stops at the target or the iteration bound");

    std::vector<LabelBox> sparse;
    for (std::size_t i = 0; i < 4; ++i) sparse.push_back(box(i, i * 200.0, 0, 30, 12));
    CollisionResult s = resolveAdaptive(sparse, cfg);
    requireTrue(s.hidden.empty(), "sparse row shows everything");
    requireClose(s.spacing, start, 1e-12, "sparse row starts at the minimum spacing");

    // The caller's minimum seeds the search and bounds any shrinking.
    CollisionConfig wide = cfg;
    wide.minSpacingPx = 20.0;
    CollisionResult w = resolveAdaptive(sparse, wide);
    requireClose(w.spacing, 20.0, 1e-12, "seeded from minSpacingPx");
    requireNoOverlap(w, 20.0, "wide spacing respected");

    std::vector<LabelBox> crowded;
    for (std::size_t i = 0; i < 30; ++i) crowded.push_back(box(i, i * 12.0, 0, 30, 12));
    CollisionResult c = resolveAdaptive(crowded, wide);
    requireTrue(c.spacing >= 20.0, "never below the minimum");

    CollisionConfig loose = cfg;
    loose.minSpacingPx = 0.0;
    requireClose(resolveAdaptive(sparse, loose).spacing, loose.initialSpacingPx, 1e-12,
                 "no minimum starts at the initial spacing");

    requireTrue(resolveAdaptive({}, cfg).visible.empty(), "empty input");
    std::printf("  Test 3 (adaptive): PASS (spacing %.0f)\n", r.spacing);
  }

  // ---- Test 4: priority and critical labels ----
  {
    std::vector<LabelBox> labels = {
      box(0, 0, 0, 50, 12, false, 1),
      box(1, 10, 0, 50, 12, false, 9),
      box(2, 20, 0, 50, 12, true, 0),
    };
    CollisionResult r = resolveLabels(labels, 0);
    requireTrue(r.visible.size() == 1 && r.visible[0].id == 2, "major beats priority");

    labels[2].isMajor = false;
    r = resolveLabels(labels, 0);
    requireTrue(r.visible.size() == 1 && r.visible[0].id == 1, "highest priority wins");

    CollisionResult c = resolveWithCritical(labels, {0}, 0);
    requireTrue(c.visible.size() == 1 && c.visible[0].id == 0, "critical kept first");
    CollisionResult both = resolveWithCritical(labels, {0, 2}, 0);
    requireTrue(both.visible.size() == 2, "critical labels kept even when they overlap");
    requireTrue(both.hidden.size() == 1 && both.hidden[0].id == 1, "the rest is resolved");
    std::printf("  Test 4 (priority): PASS\n");
  }

  // ---- Test 5: layered layout ----
  {
    std::vector<LabelBox> labels;
    for (std::size_t i = 0; i < 12; ++i) labels.push_back(box(i, i * 25.0, 0, 40, 12));
    std::vector<CollisionResult> rows = layeredLayout(labels, 2, 16, 4);
    requireTrue(rows.size() == 2, "two rows");
    std::size_t shown = 0;
    for (std::size_t k = 0; k < rows.size(); ++k) {
      requireNoOverlap(rows[k], 4, "row without overlap");
      for (const auto& l : rows[k].visible) {
        requireClose(l.y, static_cast<double>(k) * 16.0, 1e-12, "row offset");
      }
      shown += rows[k].visible.size();
    }
    CollisionResult flat = resolveLabels(labels, 4);
    requireTrue(shown > flat.visible.size(), "layers show more labels than one row");
    requireTrue(layeredLayout(labels, 0, 16, 4).size() == 1, "layers clamp to one");
    std::printf("  Test 5 (layered): PASS\n");
  }

  // ---- Test 6: position suggestion ----
  {
    std::vector<LabelBox> placed = {box(0, 100, 100, 40, 12)};
    LabelBox out;
    requireTrue(suggestLabelPosition(box(1, 300, 100, 40, 12), placed, 4, out), "free");
    requireClose(out.x, 300, 1e-12, "kept in place");

    requireTrue(suggestLabelPosition(box(1, 100, 100, 40, 12), placed, 4, out), "moved");
    requireClose(out.y, 100 - 16, 1e-12, "moved above first");

    placed.push_back(box(2, 100, 84, 40, 12));
    requireTrue(suggestLabelPosition(box(1, 100, 100, 40, 12), placed, 4, out), "below");
    requireClose(out.y, 116, 1e-12, "then below");

    placed.push_back(box(3, 100, 116, 40, 12));
    placed.push_back(box(4, 144, 100, 40, 12));
    placed.push_back(box(5, 56, 100, 40, 12));
    requireTrue(!suggestLabelPosition(box(1, 100, 100, 40, 12), placed, 4, out), "boxed in");
    std::printf("  Test 6 (suggest): PASS\n");
  }

  // ---- Test 7: rotation, width estimate and truncation ----
  {
    requireClose(estimateTextWidth("2024-03", 10), 42.0, 1e-12, "7 chars x 6 px");
    requireClose(estimateTextWidth("\xC2\xA5" "100", 10), 24.0, 1e-12, "code points counted");

    std::vector<std::string> labels = {"2024-03-15", "2024-03-22"};
    requireTrue(optimalRotation(labels, 200, 10) == 0, "fits flat");
    int angle = optimalRotation(labels, 55, 10);
    requireTrue(angle > 0 && angle < 90, "tilted");
    requireTrue(optimalRotation(labels, 5, 10) == 90, "vertical when nothing fits");

    requireTrue(truncateLabel("short", 100, 10) == "short", "fits untouched");
    std::string cut = truncateLabel("a long label text", 60, 10);
    requireTrue(cut == "a long ...", "cut with ellipsis");
    requireTrue(estimateTextWidth(cut, 10) <= 60, "result fits");
    requireTrue(truncateLabel("abcdef", 20, 10).empty(), "too narrow for anything");
    std::printf("  Test 7 (text helpers): PASS\n");
  }

  // ---- Test 8: boxes from axis ticks ----
  {
    std::vector<AxisTick> ticks(3);
    for (std::size_t i = 0; i < ticks.size(); ++i) {
      ticks[i].pixel = 100.0 * static_cast<double>(i + 1);
      ticks[i].label = "03-1" + std::to_string(i);
      ticks[i].isMajor = i == 1;
    }
    ticks[2].isKeyBoundary = true;

    std::vector<LabelBox> time = labelBoxesFromTimeTicks(ticks, 10, 380);
    requireClose(time[0].x + time[0].width * 0.5, 100.0, 1e-12, "centred on the tick");
    requireClose(time[0].y, 380, 1e-12, "on the baseline");
    requireTrue(time[1].priority > time[2].priority && time[2].priority > time[0].priority,
                "major > key > plain");

    std::vector<LabelBox> price = labelBoxesFromPriceTicks(ticks, 10, 760);
    requireClose(price[0].y + price[0].height * 0.5, 100.0, 1e-12, "centred vertically");
    requireClose(price[2].x, 760, 1e-12, "in the column");
    requireTrue(price[2].priority > price[1].priority, "key level outranks major");
    std::printf("  Test 8 (tick boxes): PASS\n");
  }

  std::printf("D4.1 label collision: ALL PASS\n");
  return 0;
}
