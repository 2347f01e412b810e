#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/pot/pot_types.hpp"

namespace farmer::util {
class WorkerPool;
}

namespace farmer::pot {

class PotError : public std::runtime_error {
 public:
  explicit PotError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Iterations is not a multiple of the number of checkpoints times two.
class NotMultipleOfCheckpoints : public PotError {
 public:
  NotMultipleOfCheckpoints(uint32_t iterations, uint64_t num_checkpoints);

  uint32_t iterations() const {
    return iterations_;
  }

  uint64_t num_checkpoints() const {
    return num_checkpoints_;
  }

 private:
  uint32_t iterations_;
  uint64_t num_checkpoints_;
};

/*
  Runs proof-of-time proving and produces kNumCheckpoints checkpoints.

  Takes time proportional to `iterations`; there is no way to
  parallelize it. Throws NotMultipleOfCheckpoints unless iterations is a
  multiple of 2 * kNumCheckpoints, and std::invalid_argument for zero.
*/
PotCheckpoints Prove(const PotSeed& seed, uint32_t iterations);

/*
  Verifies checkpoints produced with `iterations` spread evenly across
  them. Segments are checked in parallel on `pool`.

  Throws NotMultipleOfCheckpoints unless iterations is a multiple of
  2 * checkpoints.size(), including when checkpoints is empty.
*/
bool Verify(const PotSeed& seed, uint32_t iterations, const std::vector<PotOutput>& checkpoints, farmer::util::WorkerPool& pool);

// Verify on the process-wide worker pool.
bool Verify(const PotSeed& seed, uint32_t iterations, const std::vector<PotOutput>& checkpoints);

} // namespace farmer::pot
