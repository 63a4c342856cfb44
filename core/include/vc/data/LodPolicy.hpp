#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vc {

struct LODLevel {
    int level{0};
    double barsPerPixelThreshold{0};
    std::uint32_t aggregationFactor{1};
    std::string description;
};

struct LodPolicyConfig {
    std::vector<LODLevel> levels = {
        {0, 0.1, 1, "Ultra High"},
        {1, 1.0, 1, "High"},
        {2, 5.0, 5, "Medium"},
        {3, 20.0, 20, "Low"},
    };
};

// Picks the coarsest tier whose threshold is <= barsPerPixel; the finest
// tier when none qualifies. Pure function of the density.
const LODLevel& selectLod(const LodPolicyConfig& cfg, double barsPerPixel);

class LodController {
public:
    void setConfig(const LodPolicyConfig& cfg);
    const LodPolicyConfig& config() const { return config_; }

    bool evaluate(double barsPerPixel);   // returns true if level changed
    const LODLevel& current() const { return current_; }
    std::uint32_t currentFactor() const { return current_.aggregationFactor; }

private:
    LodPolicyConfig config_;
    LODLevel current_{config_.levels.front()};
};

} // namespace vc
