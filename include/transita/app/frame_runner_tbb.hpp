#pragma once

#include <transita/app/frame_runner.hpp>
#include <cstddef>

#ifdef TRANSITA_HAS_TBB

namespace transita::app {

/// Runs task(i) for every i in [0, count) with tbb::parallel_for over a
/// blocked_range; returns once all indices are done. The task is invoked
/// from TBB worker threads and must be thread-safe.
void run_indexed_tbb(std::size_t count, const IndexTask& task);

}  // namespace transita::app

#endif  // TRANSITA_HAS_TBB
