#include "vc/data/SyntheticBarLoader.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vc {

SyntheticBarLoader::SyntheticBarLoader(const SyntheticBarLoaderConfig& config)
    : config_(config), state_(config.seed ? config.seed : 1u),
      firstOpen_(config.startPrice), lastClose_(config.startPrice) {}

double SyntheticBarLoader::nextRandom() {
    // xorshift32, mapped to [-1, 1)
    state_ ^= state_ << 13;
    state_ ^= state_ >> 17;
    state_ ^= state_ << 5;
    return static_cast<double>(state_) / 2147483648.0 - 1.0;
}

PriceBar SyntheticBarLoader::makeBar(TimeMs t, double prevClose) {
    PriceBar b;
    b.timestamp = t;
    b.open = prevClose;
    double move = nextRandom() * config_.volatility;
    b.close = std::max(0.01, prevClose * (1.0 + move));
    double wick = std::fabs(nextRandom()) * config_.volatility * 0.5;
    b.high = std::max(b.open, b.close) * (1.0 + wick);
    b.low = std::min(b.open, b.close) * (1.0 - wick);
    b.volume = config_.baseVolume * (1.0 + 0.5 * nextRandom());
    return b;
}

BarSeries SyntheticBarLoader::generateHistory(TimeMs endTime, std::size_t count) {
    BarSeries bars;
    bars.reserve(count);
    double price = config_.startPrice;
    TimeMs start = endTime - static_cast<TimeMs>(count > 0 ? count - 1 : 0) *
                   config_.intervalMs;
    for (std::size_t i = 0; i < count; ++i) {
        PriceBar b = makeBar(start + static_cast<TimeMs>(i) * config_.intervalMs, price);
        price = b.close;
        bars.push_back(b);
    }
    if (!bars.empty()) {
        firstOpen_ = bars.front().open;
        lastClose_ = bars.back().close;
    }
    return bars;
}

void SyntheticBarLoader::loadMoreLeft(TimeMs before, std::size_t count,
                                      LoadCallback done) {
    ++leftRequests_;
    LoadResult result;
    // Walk backwards so the new block joins the existing first open.
    double price = firstOpen_;
    for (std::size_t i = 1; i <= count; ++i) {
        TimeMs t = before - static_cast<TimeMs>(i) * config_.intervalMs;
        if (t < config_.earliestTime) break;
        PriceBar b = makeBar(t, price);
        std::swap(b.open, b.close);
        b.high = std::max(b.high, std::max(b.open, b.close));
        b.low = std::min(b.low, std::min(b.open, b.close));
        price = b.open;
        result.bars.push_back(b);
    }
    std::reverse(result.bars.begin(), result.bars.end());
    if (!result.bars.empty()) firstOpen_ = result.bars.front().open;
    deliver(std::move(done), std::move(result));
}

void SyntheticBarLoader::loadMoreRight(TimeMs after, std::size_t count,
                                       LoadCallback done) {
    ++rightRequests_;
    LoadResult result;
    double price = lastClose_;
    for (std::size_t i = 1; i <= count; ++i) {
        TimeMs t = after + static_cast<TimeMs>(i) * config_.intervalMs;
        if (config_.latestTime != 0 && t > config_.latestTime) break;
        PriceBar b = makeBar(t, price);
        price = b.close;
        result.bars.push_back(b);
    }
    if (!result.bars.empty()) lastClose_ = result.bars.back().close;
    deliver(std::move(done), std::move(result));
}

void SyntheticBarLoader::onRangeChange(std::size_t, std::size_t) {
    ++rangeChanges_;
}

void SyntheticBarLoader::deliver(LoadCallback done, LoadResult result) {
    if (config_.deferred) {
        pending_.emplace_back(std::move(done), std::move(result));
        return;
    }
    if (done) done(std::move(result));
}

std::size_t SyntheticBarLoader::pump() {
    std::size_t delivered = 0;
    while (!pending_.empty()) {
        auto item = std::move(pending_.front());
        pending_.pop_front();
        if (item.first) item.first(std::move(item.second));
        ++delivered;
    }
    return delivered;
}

} // namespace vc
