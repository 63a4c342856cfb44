#pragma once
#include "vc/data/PriceBar.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vc {

enum class LoadDirection : std::uint8_t { Left = 0, Right = 1 };

// Provenance record for one prefetched range.
struct DataBlock {
    std::size_t startIndex{0};
    std::size_t endIndex{0};
    TimeMs startTime{0};
    TimeMs endTime{0};
    std::size_t barCount{0};
    TimeMs lastAccessTime{0};
    TimeMs anchorTime{0};          // edge the request was issued from
    bool isLoading{false};
    LoadDirection direction{LoadDirection::Left};
};

struct DataBlockCacheConfig {
    std::size_t maxBlocks{64};
};

class DataBlockCache {
public:
    void setConfig(const DataBlockCacheConfig& cfg) { config_ = cfg; }

    // Registers an in-flight request; returns its block id.
    std::uint32_t beginLoad(LoadDirection dir, TimeMs anchorTime, TimeMs now);
    // Completes a request with the received bars. Failed requests are dropped.
    void completeLoad(std::uint32_t blockId, const BarSeries& bars, TimeMs now);
    void failLoad(std::uint32_t blockId);

    bool isLoading(LoadDirection dir) const;
    // True if a completed block already covers `t`.
    bool covers(TimeMs t) const;
    // True if a request from `anchorTime` towards `dir` is in flight or done.
    bool hasRequested(LoadDirection dir, TimeMs anchorTime) const;

    // Rebuilds start/end indices against the current bar sequence.
    void reindex(const BarSeries& bars);
    void touch(TimeMs from, TimeMs to, TimeMs now);
    void clear();

    std::size_t size() const { return blocks_.size(); }
    const std::vector<DataBlock>& blocks() const { return blocks_; }

private:
    void evict();

    DataBlockCacheConfig config_;
    std::vector<DataBlock> blocks_;
    std::vector<std::uint32_t> ids_;   // parallel to blocks_
    std::uint32_t nextId_{1};
};

} // namespace vc
