#include "internal/util/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using farmer::util::WorkerPool;

void TestEveryIndexRunsOnce() {
  WorkerPool pool(4);

  std::vector<std::atomic<int>> hits(1000);
  pool.ParallelFor(hits.size(), 1, [&](size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) hits[i].fetch_add(1);
  });

  for (const auto& hit : hits) assert(hit.load() == 1);
}

void TestBlocksStartOnGrainBoundaries() {
  WorkerPool pool(3);

  std::mutex                             mutex;
  std::vector<std::pair<size_t, size_t>> blocks;
  pool.ParallelFor(101, 8, [&](size_t begin, size_t end) {
    std::lock_guard lock(mutex);
    blocks.emplace_back(begin, end);
  });

  size_t covered = 0;
  for (const auto& [begin, end] : blocks) {
    assert(begin % 8 == 0);
    assert(end == 101 || end % 8 == 0);
    assert(begin < end);
    covered += end - begin;
  }
  assert(covered == 101);
  assert(blocks.size() <= pool.Size());
}

void TestEmptyRangeRunsNothing() {
  WorkerPool pool(2);

  bool called = false;
  pool.ParallelFor(0, 1, [&](size_t, size_t) { called = true; });
  assert(!called);
}

void TestFirstExceptionIsRethrown() {
  WorkerPool pool(4);

  bool threw = false;
  try {
    pool.ParallelFor(64, 1, [](size_t begin, size_t) {
      if (begin == 0) throw std::runtime_error("block failed");
    });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "block failed";
  }
  assert(threw);

  // The pool stays usable after a failed batch.
  std::atomic<size_t> sum{0};
  pool.ParallelFor(10, 1, [&](size_t begin, size_t end) { sum += end - begin; });
  assert(sum.load() == 10);
}

void TestDefaultSizeUsesHardware() {
  WorkerPool pool;
  assert(pool.Size() >= 1);
  assert(WorkerPool::Shared().Size() >= 1);
}

} // namespace

int main() {
  TestEveryIndexRunsOnce();
  TestBlocksStartOnGrainBoundaries();
  TestEmptyRangeRunsNothing();
  TestFirstExceptionIsRethrown();
  TestDefaultSizeUsesHardware();

  std::cout << "farmer_unit_worker_pool: pass\n";
  return 0;
}
