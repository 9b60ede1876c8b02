#pragma once
#include "generator.h++"
#include <vector>

namespace Flake {

  struct BulkResult {
    std::vector<uint64_t> ids;
    double seconds;
    size_t unique;
  };

  // Draws `count` IDs from one generator across `threads` worker threads.
  // The first exception raised in any worker is rethrown after all workers
  // have been joined.
  auto generate_bulk(Generator gen, uint64_t count, uint64_t threads) -> BulkResult;
}
