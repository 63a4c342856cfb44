// D2.3: edge-triggered loading (dedup, merge, failure retry, exhaustion, teardown)

#include "vc/axis/TimeFormat.hpp"
#include "vc/data/DataBlockCache.hpp"
#include "vc/data/SyntheticBarLoader.hpp"
#include "vc/viewport/ViewportManager.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Holds every request until the test resolves it.
class ScriptedLoader : public vc::DataLoader {
public:
  struct Request {
    vc::LoadDirection dir;
    vc::TimeMs anchor;
    std::size_t count;
    vc::LoadCallback done;
  };

  void loadMoreLeft(vc::TimeMs before, std::size_t count, vc::LoadCallback done) override {
    requests.push_back({vc::LoadDirection::Left, before, count, std::move(done)});
  }
  void loadMoreRight(vc::TimeMs after, std::size_t count, vc::LoadCallback done) override {
    requests.push_back({vc::LoadDirection::Right, after, count, std::move(done)});
  }

  std::size_t countFor(vc::LoadDirection dir) const {
    std::size_t n = 0;
    for (const auto& r : requests) if (r.dir == dir) ++n;
    return n;
  }

  std::vector<Request> requests;
};

static vc::BarSeries bars(vc::TimeMs from, int count) {
  vc::BarSeries out;
  for (int i = 0; i < count; ++i) {
    vc::PriceBar b;
    b.timestamp = from + i * vc::kDayMs;
    b.open = b.close = 10.0 + i;
    b.high = b.open + 1;
    b.low = b.open - 1;
    b.volume = 100;
    out.push_back(b);
  }
  return out;
}

int main() {
  using namespace vc;
  const TimeMs end = fromCivil(2024, 6, 28);

  // ---- Test 1: one request per edge, merged on completion ----
  {
    SyntheticBarLoaderConfig lc;
    lc.deferred = true;
    SyntheticBarLoader loader(lc);
    ViewportManager vm;
    vm.setData(loader.generateHistory(end, 300));
    const TimeMs first = vm.allBars().front().timestamp;

    vm.setLoader(&loader);
    requireTrue(loader.rightRequests() == 1, "window at the right edge loads right");
    requireTrue(loader.leftRequests() == 0, "left edge far away");
    requireTrue(vm.getState().isLoadingRight, "loading flag set");

    vm.setVisibleTimeRange(static_cast<double>(first + 2 * kDayMs),
                           static_cast<double>(first + 40 * kDayMs));
    requireTrue(loader.leftRequests() == 1, "window near the left edge loads left");
    vm.zoomAt(200, 1.2);
    vm.panByTime(kDayMs);
    requireTrue(loader.leftRequests() == 1, "no duplicate while in flight");
    requireTrue(loader.rightRequests() == 1, "right not reissued");
    requireTrue(loader.rangeChanges() == 3, "loader told about each mutation");

    TimeMs s0 = vm.getState().startTime;
    requireTrue(loader.pump() == 2, "two results delivered");
    requireTrue(vm.stats().loadsMerged == 2, "both merged");
    requireTrue(vm.getState().totalBars == 700, "300 + 200 + 200 bars");
    requireTrue(vm.stats().barsMerged == 400, "merge count");
    requireTrue(vm.getState().startTime == s0, "visible window kept");
    requireTrue(!vm.getState().isLoadingLeft && !vm.getState().isLoadingRight,
                "flags cleared");

    const BarSeries& all = vm.allBars();
    for (std::size_t i = 1; i < all.size(); ++i) {
      requireTrue(all[i - 1].timestamp < all[i].timestamp, "merged series ascending");
    }
    requireTrue(all.front().timestamp == first - 200 * kDayMs, "left block prepended");
    requireTrue(vm.getState().cachedRange.end <= all.size(), "cached range in bounds");
    requireTrue(vm.blocks().size() == 2, "two blocks recorded");
    requireTrue(vm.blocks().covers(first - 100 * kDayMs), "left block covers its span");
    std::printf("  Test 1 (dedup + merge): PASS\n");
  }

  // ---- Test 2: failed load is reported and retried on the next mutation ----
  {
    ScriptedLoader loader;
    ViewportManager vm;
    vm.setData(bars(end - 99 * kDayMs, 100));

    LoadDirection failedDir = LoadDirection::Left;
    std::string failedMsg;
    vm.setOnLoadError([&](LoadDirection d, const std::string& m) {
      failedDir = d;
      failedMsg = m;
    });
    vm.setLoader(&loader);
    requireTrue(loader.countFor(LoadDirection::Right) == 1, "right load issued");
    requireTrue(loader.requests[0].count >= vm.config().loadBatchSize, "batch size floor");

    LoadResult fail;
    fail.ok = false;
    fail.error = "timeout";
    loader.requests[0].done(fail);
    requireTrue(vm.stats().loadsFailed == 1, "failure counted");
    requireTrue(vm.lastLoadError() == "timeout", "last error kept");
    requireTrue(failedDir == LoadDirection::Right && failedMsg == "timeout", "error callback");
    requireTrue(!vm.getState().isLoadingRight, "flag cleared after failure");
    requireTrue(vm.blocks().size() == 0, "failed block dropped");
    requireTrue(vm.getState().totalBars == 100, "data untouched");

    vm.panByTime(-kHourMs);
    requireTrue(loader.countFor(LoadDirection::Right) == 2, "retried on next mutation");
    std::printf("  Test 2 (failure retry): PASS\n");
  }

  // ---- Test 3: an empty result marks the edge exhausted ----
  {
    ScriptedLoader loader;
    ViewportManager vm;
    vm.setData(bars(end - 99 * kDayMs, 100));
    vm.setLoader(&loader);
    requireTrue(loader.requests.size() == 1, "right load issued");

    loader.requests[0].done(LoadResult{});
    requireTrue(vm.stats().loadsMerged == 1, "empty result still completes");
    vm.panByTime(-kHourMs);
    vm.panByTime(kHourMs);
    requireTrue(loader.countFor(LoadDirection::Right) == 1, "exhausted edge not reloaded");

    // New data re-arms the edges.
    vm.mergeBars(bars(end + kDayMs, 1));
    vm.panByTime(kHourMs);
    requireTrue(loader.countFor(LoadDirection::Right) == 2, "re-armed after merge");
    std::printf("  Test 3 (exhaustion): PASS\n");
  }

  // ---- Test 4: results arriving after teardown are discarded ----
  {
    ScriptedLoader loader;
    auto vm = std::unique_ptr<ViewportManager>(new ViewportManager());
    vm->setData(bars(end - 99 * kDayMs, 100));
    vm->setLoader(&loader);
    requireTrue(loader.requests.size() == 1, "request pending");

    vm.reset();
    LoadResult late;
    late.bars = bars(end + kDayMs, 10);
    loader.requests[0].done(late);
    std::printf("  Test 4 (late result after teardown): PASS\n");
  }

  // ---- Test 5: block cache bookkeeping and LRU eviction ----
  {
    DataBlockCache cache;
    DataBlockCacheConfig cfg;
    cfg.maxBlocks = 2;
    cache.setConfig(cfg);

    std::uint32_t a = cache.beginLoad(LoadDirection::Left, 0, 1);
    requireTrue(cache.isLoading(LoadDirection::Left), "in flight");
    requireTrue(!cache.isLoading(LoadDirection::Right), "other edge idle");
    cache.completeLoad(a, bars(10 * kDayMs, 11), 1);
    requireTrue(!cache.isLoading(LoadDirection::Left), "completed");

    std::uint32_t b = cache.beginLoad(LoadDirection::Right, 0, 2);
    cache.completeLoad(b, bars(30 * kDayMs, 11), 2);
    cache.touch(10 * kDayMs, 20 * kDayMs, 5);

    std::uint32_t c = cache.beginLoad(LoadDirection::Right, 0, 6);
    requireTrue(!cache.covers(55 * kDayMs), "in-flight block covers nothing");
    cache.completeLoad(c, bars(50 * kDayMs, 11), 6);

    requireTrue(cache.size() == 2, "evicted down to the cap");
    requireTrue(cache.covers(15 * kDayMs), "recently touched block kept");
    requireTrue(!cache.covers(35 * kDayMs), "least recently used block evicted");
    requireTrue(cache.covers(55 * kDayMs), "newest block kept");

    std::uint32_t d = cache.beginLoad(LoadDirection::Left, 0, 7);
    cache.failLoad(d);
    requireTrue(cache.size() == 2, "failed block removed");

    BarSeries all = bars(0, 70);
    cache.reindex(all);
    for (const auto& blk : cache.blocks()) {
      requireTrue(all[blk.startIndex].timestamp == blk.startTime, "start index");
      requireTrue(all[blk.endIndex].timestamp == blk.endTime, "end index");
    }
    cache.clear();
    requireTrue(cache.size() == 0, "cleared");
    std::printf("  Test 5 (block cache): PASS\n");
  }

  // ---- Test 6: an edge already requested is not requested again ----
  {
    ScriptedLoader loader;
    ViewportManager vm;
    vm.setData(bars(end - 99 * kDayMs, 100));
    vm.setLoader(&loader);
    requireTrue(loader.countFor(LoadDirection::Right) == 1, "right load issued");

    // Only bars already held come back, so the edge does not move.
    LoadResult stale;
    stale.bars = bars(end - 9 * kDayMs, 10);
    loader.requests[0].done(stale);
    requireTrue(vm.getState().totalBars == 100, "nothing new merged");
    requireTrue(vm.blocks().hasRequested(LoadDirection::Right, end), "request recorded");

    // Merging on the far edge re-arms both edges; the right anchor is unchanged.
    requireTrue(vm.mergeBars(bars(end - 100 * kDayMs, 1)) == 1, "left bar merged");
    vm.panByTime(-kHourMs);
    vm.panByTime(kHourMs);
    requireTrue(loader.countFor(LoadDirection::Right) == 1, "same anchor not reloaded");
    requireTrue(loader.countFor(LoadDirection::Left) == 0, "left edge far away");
    std::printf("  Test 6 (requested anchor): PASS\n");
  }

  // ---- Test 7: swapping the loader keeps in-flight requests ----
  {
    ScriptedLoader first, second;
    ViewportManager vm;
    vm.setData(bars(end - 99 * kDayMs, 100));
    vm.setLoader(&first);
    requireTrue(first.countFor(LoadDirection::Right) == 1, "first loader asked");

    vm.setLoader(&second);
    requireTrue(vm.getState().isLoadingRight, "still loading after the swap");
    vm.panByTime(-kHourMs);
    requireTrue(second.requests.empty(), "no duplicate request on the new loader");

    LoadResult more;
    more.bars = bars(end + kDayMs, 5);
    first.requests[0].done(more);
    requireTrue(vm.getState().totalBars == 105, "late result from the old loader merged");
    requireTrue(!vm.getState().isLoadingRight, "flag cleared");

    vm.panByTime(kHourMs);
    requireTrue(second.countFor(LoadDirection::Right) == 1, "new edge goes to the new loader");
    requireTrue(first.requests.size() == 1, "old loader not asked again");
    std::printf("  Test 7 (loader swap): PASS\n");
  }

  std::printf("D2.3 viewport loading: ALL PASS\n");
  return 0;
}
