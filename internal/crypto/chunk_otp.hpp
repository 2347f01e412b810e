#pragma once

#include <array>
#include <cstdint>

#include "internal/crypto/witness.hpp"
#include "internal/model/piece.hpp"

namespace farmer::crypto {

// One-time pad for one chunk: enough bits for any space_l up to 64.
using ChunkOtp = std::array<uint8_t, 8>;

ChunkOtp DeriveChunkOtp(const farmer::model::SectorId& sector_id, const Witness& witness, uint32_t chunk_index);

} // namespace farmer::crypto
