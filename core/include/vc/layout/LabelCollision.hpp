#pragma once
#include "vc/axis/AxisTick.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace vc {

struct LabelBox {
  double x{0}, y{0};          // top-left, pixels
  double width{0}, height{0};
  int priority{0};            // higher wins
  bool isMajor{false};
  std::size_t id{0};          // caller's handle (e.g. tick index)
  std::string text;
};

struct CollisionResult {
  std::vector<LabelBox> visible;
  std::vector<LabelBox> hidden;
  std::size_t collisionCount{0};
  double density{0};          // occupied width / candidate span, capped at 1
  double spacing{0};          // spacing the result was resolved with
};

struct CollisionConfig {
  double minSpacingPx{8.0};
  double targetDensity{0.7};
  double initialSpacingPx{4.0};
  double growStepPx{4.0};
  double shrinkStepPx{2.0};
  int maxIterations{20};
};

// AABB test with both boxes expanded by spacing/2 on every side.
bool boxesOverlap(const LabelBox& a, const LabelBox& b, double spacing);

// Greedy pass: majors first, then descending priority; a candidate is kept
// if it overlaps no already-kept box.
CollisionResult resolveLabels(const std::vector<LabelBox>& labels, double minSpacingPx);

// Starts at max(initialSpacingPx, minSpacingPx). Grows the spacing while
// density exceeds the target and shrinks it while density is well below target
// and labels are hidden, never below minSpacingPx and never back down to a
// spacing that already overflowed. Bounded by maxIterations.
CollisionResult resolveAdaptive(const std::vector<LabelBox>& labels,
                                const CollisionConfig& cfg = CollisionConfig{});

// Boxes whose id is in `criticalIds` are kept unconditionally, then the
// greedy pass runs over the rest.
CollisionResult resolveWithCritical(const std::vector<LabelBox>& labels,
                                    const std::vector<std::size_t>& criticalIds,
                                    double minSpacingPx);

// Spreads labels (in x order) round-robin over `layers` rows spaced
// `layerHeight` apart and resolves each row on its own.
std::vector<CollisionResult> layeredLayout(const std::vector<LabelBox>& labels,
                                           int layers, double layerHeight,
                                           double minSpacingPx);

// First free slot among: in place, above, below, right, left.
// Returns false if every slot collides.
bool suggestLabelPosition(const LabelBox& label, const std::vector<LabelBox>& placed,
                          double spacing, LabelBox& out);

// Smallest of 0/30/45/60/90 degrees at which every label fits the
// available per-label width.
int optimalRotation(const std::vector<std::string>& labels, double availableWidth,
                    double fontSize);

// Monospace estimate: code points x fontSize x 0.6.
double estimateTextWidth(const std::string& text, double fontSize);

// Cuts `text` to fit `maxWidth`, ending in "..."; empty if even that does not fit.
std::string truncateLabel(const std::string& text, double maxWidth, double fontSize);

double labelDensity(const std::vector<LabelBox>& visible, double spacing, double span);

// Candidate boxes centred on each tick. Time labels sit on a row at `baselineY`;
// price labels in a column starting at `columnX`.
std::vector<LabelBox> labelBoxesFromTimeTicks(const std::vector<AxisTick>& ticks,
                                              double fontSize, double baselineY);
std::vector<LabelBox> labelBoxesFromPriceTicks(const std::vector<AxisTick>& ticks,
                                               double fontSize, double columnX);

} // namespace vc
