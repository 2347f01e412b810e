#include "proof_of_time.hpp"

#include <cstdint>

#include "internal/observability/logging.hpp"
#include "internal/pot/aes.hpp"
#include "internal/util/time.hpp"
#include "internal/util/worker_pool.hpp"

namespace farmer::pot {

using farmer::observability::IntField;
using farmer::observability::UintField;

namespace {

void CheckIterations(uint32_t iterations, uint64_t num_checkpoints) {
  if (iterations == 0) {
    throw std::invalid_argument("iterations must be non-zero");
  }
  if (num_checkpoints == 0 || iterations % (num_checkpoints * 2) != 0) {
    throw NotMultipleOfCheckpoints(iterations, num_checkpoints);
  }
}

} // namespace

NotMultipleOfCheckpoints::NotMultipleOfCheckpoints(uint32_t iterations, uint64_t num_checkpoints)
    : PotError("Iterations " + std::to_string(iterations) + " is not multiple of number of checkpoints " + std::to_string(num_checkpoints) +
               " times two"),
      iterations_(iterations),
      num_checkpoints_(num_checkpoints) {
}

PotCheckpoints Prove(const PotSeed& seed, uint32_t iterations) {
  const auto started = farmer::util::Now();
  CheckIterations(iterations, kNumCheckpoints);

  auto checkpoints = aes::Create(seed, DeriveKey(seed), iterations / kNumCheckpoints);

  FARMER_LOG_INFO("create slot time", {UintField("iterations", iterations), IntField("elapsed_ms", farmer::util::ElapsedMillis(started))});
  return checkpoints;
}

bool Verify(const PotSeed& seed, uint32_t iterations, const std::vector<PotOutput>& checkpoints, farmer::util::WorkerPool& pool) {
  const auto started = farmer::util::Now();
  const auto num_checkpoints = static_cast<uint64_t>(checkpoints.size());
  CheckIterations(iterations, num_checkpoints);

  // num_checkpoints * 2 divides iterations, so the quotient fits in 32 bits.
  const auto checkpoint_iterations = static_cast<uint32_t>(iterations / num_checkpoints);
  const bool valid = aes::VerifySequential(seed, DeriveKey(seed), checkpoints, checkpoint_iterations, pool);

  FARMER_LOG_INFO("verify slot time", {UintField("iterations", iterations), IntField("elapsed_ms", farmer::util::ElapsedMillis(started))});
  return valid;
}

bool Verify(const PotSeed& seed, uint32_t iterations, const std::vector<PotOutput>& checkpoints) {
  return Verify(seed, iterations, checkpoints, farmer::util::WorkerPool::Shared());
}

} // namespace farmer::pot
