#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

namespace farmer::util {

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0) {
    threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }

  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

WorkerPool& WorkerPool::Shared() {
  static WorkerPool pool;
  return pool;
}

void WorkerPool::Enqueue(std::function<void()> task) {
  {
    std::lock_guard lock(mutex_);
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::Run() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !tasks_.empty(); });

      if (shutdown_ && tasks_.empty()) return;

      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

void WorkerPool::ParallelFor(std::size_t count, std::size_t grain, const std::function<void(std::size_t, std::size_t)>& fn) {
  if (count == 0) return;
  if (grain == 0) grain = 1;

  // Split into at most Size() blocks, each a whole number of grains.
  const std::size_t grains     = (count + grain - 1) / grain;
  const std::size_t blocks     = std::min(grains, threads_.size());
  const std::size_t per_block  = (grains + blocks - 1) / blocks;
  const std::size_t block_size = per_block * grain;

  struct Join {
    std::mutex              mutex;
    std::condition_variable cv;
    std::size_t             remaining = 0;
    std::exception_ptr      error;
  } join;

  std::vector<std::pair<std::size_t, std::size_t>> ranges;
  for (std::size_t begin = 0; begin < count; begin += block_size) {
    ranges.emplace_back(begin, std::min(count, begin + block_size));
  }
  join.remaining = ranges.size();

  for (const auto& [begin, end] : ranges) {
    Enqueue([&join, &fn, begin = begin, end = end] {
      std::exception_ptr error;
      try {
        fn(begin, end);
      } catch (...) {
        error = std::current_exception();
      }

      std::lock_guard lock(join.mutex);
      if (error && !join.error) join.error = error;
      if (--join.remaining == 0) join.cv.notify_one();
    });
  }

  std::unique_lock lock(join.mutex);
  join.cv.wait(lock, [&] { return join.remaining == 0; });

  if (join.error) std::rethrow_exception(join.error);
}

} // namespace farmer::util
