#pragma once

#include <cstddef>
#include <functional>

namespace transita::app {

/// Work for one output index. Invoked from worker threads; must be
/// thread-safe and must not throw.
using IndexTask = std::function<void(std::size_t index)>;

/// Runs task(i) for every i in [0, count) on the calling thread, in order.
void run_indexed(std::size_t count, const IndexTask& task);

/// Runs task(i) for every i in [0, count) on a thread pool; returns once all
/// indices are done. num_workers 0 = use hardware concurrency. Falls back to
/// run_indexed when one worker suffices.
void run_indexed_parallel(std::size_t count, const IndexTask& task,
                          std::size_t num_workers = 0);

}  // namespace transita::app
