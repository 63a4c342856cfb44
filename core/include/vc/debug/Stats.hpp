#pragma once
#include <cstdint>

namespace vc {

struct DebugToggles {
  bool logRange = false;       // every visible-range mutation
  bool logLoads = false;       // load issue / merge
  bool logLod = false;         // LOD level switches
  bool logIndicators = false;  // indicator computations and cache hits
};

struct ViewportStats {
  std::uint64_t rangeMutations = 0;
  std::uint64_t rejectedMutations = 0;

  std::uint64_t loadsIssued = 0;
  std::uint64_t loadsMerged = 0;
  std::uint64_t loadsFailed = 0;
  std::uint64_t barsMerged = 0;

  std::uint64_t framesScheduled = 0;
  std::uint64_t lodSwitches = 0;
};

struct IndicatorStats {
  std::uint64_t computations = 0;
  std::uint64_t cacheHits = 0;
  std::uint64_t scalarComputations = 0;
  std::uint64_t scalarCacheHits = 0;
  std::uint64_t errors = 0;
};

} // namespace vc
