#pragma once
#include "vc/data/PriceBar.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace vc {

struct LoadResult {
    bool ok{true};
    std::string error;
    BarSeries bars;
};

using LoadCallback = std::function<void(LoadResult)>;

// Asynchronous source of historical bars. A call returns immediately; the
// loader invokes `done` exactly once, from any later point on the caller's
// thread. Timeout policy is the loader's own.
class DataLoader {
public:
    virtual ~DataLoader() = default;

    // Bars older than the earliest loaded bar.
    virtual void loadMoreLeft(TimeMs before, std::size_t count, LoadCallback done) = 0;
    // Bars newer than the latest loaded bar.
    virtual void loadMoreRight(TimeMs after, std::size_t count, LoadCallback done) = 0;

    // Visible index range after every successful range mutation.
    virtual void onRangeChange(std::size_t startIndex, std::size_t endIndex) {
        (void)startIndex;
        (void)endIndex;
    }
};

} // namespace vc
