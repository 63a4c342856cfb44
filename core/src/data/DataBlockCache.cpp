#include "vc/data/DataBlockCache.hpp"
#include <algorithm>

namespace vc {

std::uint32_t DataBlockCache::beginLoad(LoadDirection dir, TimeMs anchorTime,
                                        TimeMs now) {
    DataBlock b;
    b.direction = dir;
    b.startTime = anchorTime;
    b.endTime = anchorTime;
    b.anchorTime = anchorTime;
    b.isLoading = true;
    b.lastAccessTime = now;

    std::uint32_t id = nextId_++;
    blocks_.push_back(b);
    ids_.push_back(id);
    return id;
}

void DataBlockCache::completeLoad(std::uint32_t blockId, const BarSeries& bars,
                                  TimeMs now) {
    for (std::size_t i = 0; i < ids_.size(); ++i) {
        if (ids_[i] != blockId) continue;
        DataBlock& b = blocks_[i];
        b.isLoading = false;
        b.lastAccessTime = now;
        b.barCount = bars.size();
        if (!bars.empty()) {
            auto mm = std::minmax_element(bars.begin(), bars.end(),
                [](const PriceBar& a, const PriceBar& c) {
                    return a.timestamp < c.timestamp;
                });
            b.startTime = mm.first->timestamp;
            b.endTime = mm.second->timestamp;
        }
        break;
    }
    evict();
}

void DataBlockCache::failLoad(std::uint32_t blockId) {
    for (std::size_t i = 0; i < ids_.size(); ++i) {
        if (ids_[i] == blockId) {
            blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(i));
            ids_.erase(ids_.begin() + static_cast<std::ptrdiff_t>(i));
            return;
        }
    }
}

bool DataBlockCache::isLoading(LoadDirection dir) const {
    for (const auto& b : blocks_) {
        if (b.isLoading && b.direction == dir) return true;
    }
    return false;
}

bool DataBlockCache::covers(TimeMs t) const {
    for (const auto& b : blocks_) {
        if (!b.isLoading && b.barCount > 0 && t >= b.startTime && t <= b.endTime)
            return true;
    }
    return false;
}

bool DataBlockCache::hasRequested(LoadDirection dir, TimeMs anchorTime) const {
    for (const auto& b : blocks_) {
        if (b.direction == dir && b.anchorTime == anchorTime) return true;
    }
    return false;
}

void DataBlockCache::reindex(const BarSeries& bars) {
    for (auto& b : blocks_) {
        if (b.isLoading || b.barCount == 0) continue;
        b.startIndex = lowerBoundIndex(bars, b.startTime);
        std::size_t end = upperBoundIndex(bars, b.endTime);
        b.endIndex = end > 0 ? end - 1 : 0;
    }
}

void DataBlockCache::touch(TimeMs from, TimeMs to, TimeMs now) {
    for (auto& b : blocks_) {
        if (b.endTime >= from && b.startTime <= to) b.lastAccessTime = now;
    }
}

void DataBlockCache::clear() {
    blocks_.clear();
    ids_.clear();
}

void DataBlockCache::evict() {
    // Least recently accessed completed blocks go first.
    while (blocks_.size() > config_.maxBlocks) {
        std::size_t victim = blocks_.size();
        for (std::size_t i = 0; i < blocks_.size(); ++i) {
            if (blocks_[i].isLoading) continue;
            if (victim == blocks_.size() ||
                blocks_[i].lastAccessTime < blocks_[victim].lastAccessTime) {
                victim = i;
            }
        }
        if (victim == blocks_.size()) return;
        blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(victim));
        ids_.erase(ids_.begin() + static_cast<std::ptrdiff_t>(victim));
    }
}

} // namespace vc
