#include "vc/data/LodPolicy.hpp"

namespace vc {

static const LODLevel kRawLevel{0, 0.0, 1, "Raw"};

const LODLevel& selectLod(const LodPolicyConfig& cfg, double barsPerPixel) {
    if (cfg.levels.empty()) return kRawLevel;

    // Levels may arrive in any order; take the largest qualifying threshold.
    const LODLevel* best = nullptr;
    const LODLevel* finest = &cfg.levels.front();
    for (const auto& lvl : cfg.levels) {
        if (lvl.barsPerPixelThreshold < finest->barsPerPixelThreshold) finest = &lvl;
        if (lvl.barsPerPixelThreshold <= barsPerPixel) {
            if (!best || lvl.barsPerPixelThreshold > best->barsPerPixelThreshold) {
                best = &lvl;
            }
        }
    }
    return best ? *best : *finest;
}

void LodController::setConfig(const LodPolicyConfig& cfg) {
    config_ = cfg;
    current_ = selectLod(config_, 0.0);
}

bool LodController::evaluate(double barsPerPixel) {
    const LODLevel& next = selectLod(config_, barsPerPixel);
    bool changed = next.level != current_.level ||
                   next.aggregationFactor != current_.aggregationFactor;
    current_ = next;
    return changed;
}

} // namespace vc
