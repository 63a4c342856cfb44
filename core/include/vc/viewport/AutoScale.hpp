#pragma once
#include "vc/data/PriceBar.hpp"

namespace vc {

struct AutoScaleConfig {
  double priceMargin{0.08};     // 8% of the range on each side
  double volumeHeadroom{0.10};  // 10% above the tallest bar
  bool includeZero{false};
};

class AutoScale {
public:
  void setConfig(const AutoScaleConfig& cfg) { config_ = cfg; }
  const AutoScaleConfig& config() const { return config_; }

  // Padded price range of the given bars. Returns false for no bars.
  // A flat range is widened by the margin applied to the price itself.
  bool computePriceRange(const PriceBar* bars, std::size_t count,
                         double& lo, double& hi) const;

  // [0, maxVolume * (1 + headroom)]; [0, 1] when all volumes are zero.
  bool computeVolumeRange(const PriceBar* bars, std::size_t count,
                          double& lo, double& hi) const;

private:
  AutoScaleConfig config_;
};

} // namespace vc
