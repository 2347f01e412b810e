#pragma once

#include <cstddef>
#include <cstdint>

#include "internal/crypto/witness.hpp"
#include "internal/model/piece.hpp"

namespace farmer::util {
class WorkerPool;
}

namespace farmer::plotting {

/*
  One-time-pad encoding of a piece's record region, in place.

  The record is split into space_l-bit chunks, bits addressed LSB-first
  within each byte. Chunk i is XORed with DeriveChunkOtp(sector, witness, i).
  Only whole chunks are encoded: the trailing record_size * 8 % space_l
  bits are left as they are.

  Chunks are independent and run in parallel on `pool`; blocks handed to
  workers start on byte boundaries so no two workers touch the same byte.
  Encoding twice with the same sector and witness restores the input.
*/
void EncodeRecord(uint8_t* record, std::size_t record_size, uint16_t space_l, const farmer::model::SectorId& sector_id,
                  const farmer::crypto::Witness& witness, farmer::util::WorkerPool& pool);

// Number of whole chunks EncodeRecord transforms.
uint64_t ChunksInRecord(std::size_t record_size, uint16_t space_l);

} // namespace farmer::plotting
