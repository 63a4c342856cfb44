#include "vc/layout/LabelCollision.hpp"

#include <algorithm>
#include <cmath>

namespace vc {

bool boxesOverlap(const LabelBox& a, const LabelBox& b, double spacing) {
  double h = spacing * 0.5;
  return (a.x - h) < (b.x + b.width + h) && (a.x + a.width + h) > (b.x - h) &&
         (a.y - h) < (b.y + b.height + h) && (a.y + a.height + h) > (b.y - h);
}

static double candidateSpan(const std::vector<LabelBox>& labels) {
  if (labels.empty()) return 0;
  double lo = labels.front().x;
  double hi = labels.front().x + labels.front().width;
  for (const auto& l : labels) {
    lo = std::min(lo, l.x);
    hi = std::max(hi, l.x + l.width);
  }
  return hi - lo;
}

double labelDensity(const std::vector<LabelBox>& visible, double spacing, double span) {
  if (span <= 0 || visible.empty()) return 0;
  double occupied = 0;
  for (const auto& l : visible) occupied += l.width + spacing;
  return std::min(1.0, occupied / span);
}

static std::vector<LabelBox> sortedByImportance(const std::vector<LabelBox>& labels) {
  std::vector<LabelBox> sorted = labels;
  std::stable_sort(sorted.begin(), sorted.end(), [](const LabelBox& a, const LabelBox& b) {
    if (a.isMajor != b.isMajor) return a.isMajor;
    return a.priority > b.priority;
  });
  return sorted;
}

static void greedyPass(const std::vector<LabelBox>& sorted, double spacing,
                       CollisionResult& r) {
  for (const auto& cand : sorted) {
    bool clash = false;
    for (const auto& kept : r.visible) {
      if (boxesOverlap(cand, kept, spacing)) {
        clash = true;
        break;
      }
    }
    if (clash) {
      r.hidden.push_back(cand);
      ++r.collisionCount;
    } else {
      r.visible.push_back(cand);
    }
  }
}

CollisionResult resolveLabels(const std::vector<LabelBox>& labels, double minSpacingPx) {
  CollisionResult r;
  r.spacing = std::max(0.0, minSpacingPx);
  greedyPass(sortedByImportance(labels), r.spacing, r);
  r.density = labelDensity(r.visible, r.spacing, candidateSpan(labels));
  return r;
}

CollisionResult resolveAdaptive(const std::vector<LabelBox>& labels,
                                const CollisionConfig& cfg) {
  // Never tighter than the caller's minimum spacing.
  const double minSpacing = std::max(0.0, cfg.minSpacingPx);
  double spacing = std::max(cfg.initialSpacingPx, minSpacing);
  double overfull = -1.0;   // largest spacing that exceeded the target
  CollisionResult r = resolveLabels(labels, spacing);

  for (int i = 1; i < cfg.maxIterations; ++i) {
    if (r.density > cfg.targetDensity) {
      overfull = std::max(overfull, spacing);
      spacing += cfg.growStepPx;
    } else if (r.density < cfg.targetDensity * 0.8 && !r.hidden.empty() &&
               spacing - cfg.shrinkStepPx > overfull &&
               spacing - cfg.shrinkStepPx >= minSpacing) {
      spacing -= cfg.shrinkStepPx;
    } else {
      break;
    }
    r = resolveLabels(labels, spacing);
  }
  return r;
}

CollisionResult resolveWithCritical(const std::vector<LabelBox>& labels,
                                    const std::vector<std::size_t>& criticalIds,
                                    double minSpacingPx) {
  CollisionResult r;
  r.spacing = std::max(0.0, minSpacingPx);

  std::vector<LabelBox> rest;
  for (const auto& l : labels) {
    bool critical = std::find(criticalIds.begin(), criticalIds.end(), l.id) != criticalIds.end();
    if (critical) r.visible.push_back(l);
    else rest.push_back(l);
  }

  greedyPass(sortedByImportance(rest), r.spacing, r);
  r.density = labelDensity(r.visible, r.spacing, candidateSpan(labels));
  return r;
}

std::vector<CollisionResult> layeredLayout(const std::vector<LabelBox>& labels,
                                           int layers, double layerHeight,
                                           double minSpacingPx) {
  if (layers < 1) layers = 1;
  std::vector<LabelBox> byX = labels;
  std::stable_sort(byX.begin(), byX.end(),
                   [](const LabelBox& a, const LabelBox& b) { return a.x < b.x; });

  std::vector<std::vector<LabelBox>> rows(static_cast<std::size_t>(layers));
  for (std::size_t i = 0; i < byX.size(); ++i) {
    std::size_t layer = i % static_cast<std::size_t>(layers);
    LabelBox l = byX[i];
    l.y += static_cast<double>(layer) * layerHeight;
    rows[layer].push_back(l);
  }

  std::vector<CollisionResult> out;
  out.reserve(rows.size());
  for (const auto& row : rows) out.push_back(resolveLabels(row, minSpacingPx));
  return out;
}

bool suggestLabelPosition(const LabelBox& label, const std::vector<LabelBox>& placed,
                          double spacing, LabelBox& out) {
  const double dx = label.width + spacing;
  const double dy = label.height + spacing;
  const double offsets[5][2] = {{0, 0}, {0, -dy}, {0, dy}, {dx, 0}, {-dx, 0}};

  for (const auto& o : offsets) {
    LabelBox cand = label;
    cand.x += o[0];
    cand.y += o[1];
    bool clash = false;
    for (const auto& p : placed) {
      if (boxesOverlap(cand, p, spacing)) {
        clash = true;
        break;
      }
    }
    if (!clash) {
      out = cand;
      return true;
    }
  }
  return false;
}

int optimalRotation(const std::vector<std::string>& labels, double availableWidth,
                    double fontSize) {
  double widest = 0;
  for (const auto& s : labels) widest = std::max(widest, estimateTextWidth(s, fontSize));
  const double height = fontSize * 1.2;
  const double kPi = 3.14159265358979323846;

  for (int angle : {0, 30, 45, 60}) {
    double rad = angle * kPi / 180.0;
    double footprint = widest * std::cos(rad) + height * std::sin(rad);
    if (footprint <= availableWidth) return angle;
  }
  return 90;
}

static std::size_t codePoints(const std::string& text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

double estimateTextWidth(const std::string& text, double fontSize) {
  return static_cast<double>(codePoints(text)) * fontSize * 0.6;
}

std::string truncateLabel(const std::string& text, double maxWidth, double fontSize) {
  if (estimateTextWidth(text, fontSize) <= maxWidth) return text;
  const double charW = fontSize * 0.6;
  if (charW <= 0) return text;

  auto fit = static_cast<long>(std::floor(maxWidth / charW)) - 3;
  if (fit < 1) return std::string();

  // Cut on a code point boundary.
  std::string out;
  long taken = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    auto c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) != 0x80) {
      if (taken == fit) break;
      ++taken;
    }
    out += text[i];
  }
  return out + "...";
}

std::vector<LabelBox> labelBoxesFromTimeTicks(const std::vector<AxisTick>& ticks,
                                              double fontSize, double baselineY) {
  std::vector<LabelBox> out;
  out.reserve(ticks.size());
  for (std::size_t i = 0; i < ticks.size(); ++i) {
    const AxisTick& t = ticks[i];
    LabelBox b;
    b.width = estimateTextWidth(t.label, fontSize);
    b.height = fontSize * 1.2;
    b.x = t.pixel - b.width * 0.5;
    b.y = baselineY;
    b.isMajor = t.isMajor;
    b.priority = t.isMajor ? 10 : (t.isKeyBoundary ? 5 : 1);
    b.id = i;
    b.text = t.label;
    out.push_back(b);
  }
  return out;
}

std::vector<LabelBox> labelBoxesFromPriceTicks(const std::vector<AxisTick>& ticks,
                                               double fontSize, double columnX) {
  std::vector<LabelBox> out;
  out.reserve(ticks.size());
  for (std::size_t i = 0; i < ticks.size(); ++i) {
    const AxisTick& t = ticks[i];
    LabelBox b;
    b.width = estimateTextWidth(t.label, fontSize);
    b.height = fontSize * 1.2;
    b.x = columnX;
    b.y = t.pixel - b.height * 0.5;
    b.isMajor = t.isMajor;
    b.priority = t.isKeyBoundary ? 10 : (t.isMajor ? 5 : 1);
    b.id = i;
    b.text = t.label;
    out.push_back(b);
  }
  return out;
}

} // namespace vc
