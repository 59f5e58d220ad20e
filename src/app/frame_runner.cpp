#include <transita/app/frame_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace transita::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_indexed(std::size_t count, const IndexTask& task) {
  if (!task) return;
  for (std::size_t i = 0; i < count; ++i) {
    task(i);
  }
}

void run_indexed_parallel(std::size_t count, const IndexTask& task,
                          std::size_t num_workers) {
  if (count == 0 || !task) return;

  const std::size_t workers = std::min(effective_workers(num_workers), count);
  if (workers <= 1) {
    run_indexed(count, task);
    return;
  }

  // All indices are queued before the workers start.
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < count; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      task(idx);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace transita::app
