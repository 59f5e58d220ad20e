#include <transita/app/frame_runner.hpp>
#include <transita/app/frame_runner_tbb.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cstddef>
#include <vector>

namespace ta = transita::app;

namespace {

/// One counter per index; every index must be hit exactly once.
struct VisitCounter {
  explicit VisitCounter(std::size_t n) : hits(n) {}

  ta::IndexTask task() {
    return [this](std::size_t i) { hits[i].fetch_add(1); };
  }

  bool each_once() const {
    for (const auto& h : hits) {
      if (h.load() != 1) return false;
    }
    return true;
  }

  std::vector<std::atomic<int>> hits;
};

}  // namespace

TEST(FrameRunner, SequentialVisitsInOrder) {
  std::vector<std::size_t> order;
  ta::run_indexed(5, [&order](std::size_t i) { order.push_back(i); });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
}

TEST(FrameRunner, ParallelVisitsEveryIndexOnce) {
  VisitCounter counter(257);
  ta::run_indexed_parallel(counter.hits.size(), counter.task(), 4);
  EXPECT_TRUE(counter.each_once());
}

TEST(FrameRunner, MoreWorkersThanIndices) {
  VisitCounter counter(3);
  ta::run_indexed_parallel(counter.hits.size(), counter.task(), 16);
  EXPECT_TRUE(counter.each_once());
}

TEST(FrameRunner, DefaultWorkerCount) {
  VisitCounter counter(100);
  ta::run_indexed_parallel(counter.hits.size(), counter.task());
  EXPECT_TRUE(counter.each_once());
}

TEST(FrameRunner, ZeroCountAndEmptyTask) {
  int calls = 0;
  ta::run_indexed_parallel(0, [&calls](std::size_t) { ++calls; }, 4);
  ta::run_indexed(0, [&calls](std::size_t) { ++calls; });
  EXPECT_EQ(calls, 0);
  ta::run_indexed(3, ta::IndexTask{});
  ta::run_indexed_parallel(3, ta::IndexTask{}, 2);
}

#ifdef TRANSITA_HAS_TBB
TEST(FrameRunnerTbb, VisitsEveryIndexOnce) {
  VisitCounter counter(513);
  ta::run_indexed_tbb(counter.hits.size(), counter.task());
  EXPECT_TRUE(counter.each_once());
}
#endif
