#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/pot/pot_types.hpp"

namespace farmer::util {
class WorkerPool;
}

namespace farmer::pot::aes {

/*
  Runs the AES-128 chain from `seed`, recording the state after every
  `checkpoint_iterations` encryptions. Strictly sequential.
*/
PotCheckpoints Create(const PotSeed& seed, const PotKey& key, uint32_t checkpoint_iterations);

/*
  Checks every segment of a chain independently, in parallel on `pool`.

  Segment i starts from the seed (i == 0) or checkpoint i-1; it is
  encrypted forward checkpoint_iterations / 2 times while checkpoint i
  is decrypted backward the same number of times, and the two must meet.
  `checkpoint_iterations` must be even.
*/
bool VerifySequential(const PotSeed& seed, const PotKey& key, const std::vector<PotOutput>& checkpoints, uint32_t checkpoint_iterations,
                      farmer::util::WorkerPool& pool);

} // namespace farmer::pot::aes
