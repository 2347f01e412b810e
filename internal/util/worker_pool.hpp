#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace farmer::util {

/*
  Fixed-size pool of worker threads fed from a blocking queue.

  Used for fork/join work only: ParallelFor blocks the caller until
  every block has run, so tasks never outlive the data they touch.
  Must not be called from one of the pool's own threads.
*/
class WorkerPool {
 public:
  // 0 threads means one per hardware thread.
  explicit WorkerPool(std::size_t threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::size_t Size() const {
    return threads_.size();
  }

  /*
    Runs fn(begin, end) over [0, count).

    Every block boundary except `count` itself is a multiple of `grain`,
    so callers can keep blocks from sharing a byte. The first exception
    thrown by any block is rethrown here after all blocks finished.
  */
  void ParallelFor(std::size_t count, std::size_t grain, const std::function<void(std::size_t, std::size_t)>& fn);

  // Process-wide pool sized to the hardware.
  static WorkerPool& Shared();

 private:
  void Enqueue(std::function<void()> task);
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> tasks_;
  bool                              shutdown_ = false;

  std::vector<std::thread> threads_;
};

} // namespace farmer::util
