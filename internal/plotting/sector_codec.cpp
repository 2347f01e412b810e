#include "sector_codec.hpp"

#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#include "internal/crypto/chunk_otp.hpp"
#include "internal/util/worker_pool.hpp"

namespace farmer::plotting {

namespace {

void XorChunk(uint8_t* record, uint64_t first_bit, uint16_t width, const farmer::crypto::ChunkOtp& otp) {
  for (uint16_t j = 0; j < width; ++j) {
    if (((otp[j >> 3] >> (j & 7)) & 1) == 0) continue;

    const uint64_t bit = first_bit + j;
    record[bit >> 3] ^= static_cast<uint8_t>(1u << (bit & 7));
  }
}

} // namespace

uint64_t ChunksInRecord(std::size_t record_size, uint16_t space_l) {
  if (space_l == 0 || space_l > 64) {
    throw std::invalid_argument("space_l must be in 1..64, got " + std::to_string(space_l));
  }
  return static_cast<uint64_t>(record_size) * 8 / space_l;
}

void EncodeRecord(uint8_t* record, std::size_t record_size, uint16_t space_l, const farmer::model::SectorId& sector_id,
                  const farmer::crypto::Witness& witness, farmer::util::WorkerPool& pool) {
  const uint64_t chunks = ChunksInRecord(record_size, space_l);
  if (chunks > static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 1) {
    throw std::invalid_argument("record has more chunks than a 32-bit chunk index can address");
  }

  // Smallest run of chunks that spans a whole number of bytes.
  const std::size_t grain = 8 / std::gcd<std::size_t, std::size_t>(space_l, 8);

  pool.ParallelFor(static_cast<std::size_t>(chunks), grain, [&](std::size_t begin, std::size_t end) {
    for (std::size_t chunk = begin; chunk < end; ++chunk) {
      const auto otp = farmer::crypto::DeriveChunkOtp(sector_id, witness, static_cast<uint32_t>(chunk));
      XorChunk(record, static_cast<uint64_t>(chunk) * space_l, space_l, otp);
    }
  });
}

} // namespace farmer::plotting
