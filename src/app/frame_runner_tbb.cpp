#include <transita/app/frame_runner_tbb.hpp>

#ifdef TRANSITA_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace transita::app {

void run_indexed_tbb(std::size_t count, const IndexTask& task) {
  if (count == 0 || !task) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, count),
      [&task](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          task(i);
        }
      });
}

}  // namespace transita::app

#endif  // TRANSITA_HAS_TBB
