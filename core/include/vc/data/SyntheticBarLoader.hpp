#pragma once
#include "vc/data/DataLoader.hpp"

#include <cstdint>
#include <deque>

namespace vc {

struct SyntheticBarLoaderConfig {
    TimeMs intervalMs{kDayMs};
    double startPrice{100.0};
    double volatility{0.01};      // per-bar relative move
    double baseVolume{1.0e6};
    std::uint32_t seed{42};
    TimeMs earliestTime{0};       // left loads stop here
    TimeMs latestTime{0};         // right loads stop here; 0 = unbounded
    bool deferred{false};         // hold callbacks until pump()
};

// Deterministic random-walk bar source.
class SyntheticBarLoader : public DataLoader {
public:
    explicit SyntheticBarLoader(const SyntheticBarLoaderConfig& config);

    // `count` bars ending at `endTime` (inclusive).
    BarSeries generateHistory(TimeMs endTime, std::size_t count);

    void loadMoreLeft(TimeMs before, std::size_t count, LoadCallback done) override;
    void loadMoreRight(TimeMs after, std::size_t count, LoadCallback done) override;
    void onRangeChange(std::size_t startIndex, std::size_t endIndex) override;

    // Deferred mode: delivers queued results. Returns the number delivered.
    std::size_t pump();

    std::uint32_t leftRequests() const { return leftRequests_; }
    std::uint32_t rightRequests() const { return rightRequests_; }
    std::uint32_t rangeChanges() const { return rangeChanges_; }

private:
    double nextRandom();
    PriceBar makeBar(TimeMs t, double prevClose);
    void deliver(LoadCallback done, LoadResult result);

    SyntheticBarLoaderConfig config_;
    std::uint32_t state_;
    std::deque<std::pair<LoadCallback, LoadResult>> pending_;
    std::uint32_t leftRequests_{0};
    std::uint32_t rightRequests_{0};
    std::uint32_t rangeChanges_{0};
    double firstOpen_{0};
    double lastClose_{0};
};

} // namespace vc
