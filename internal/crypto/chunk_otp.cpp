#include "chunk_otp.hpp"

#include <algorithm>

#include "internal/crypto/hash.hpp"

namespace farmer::crypto {

ChunkOtp DeriveChunkOtp(const farmer::model::SectorId& sector_id, const Witness& witness, uint32_t chunk_index) {
  const auto index = LittleEndian32(chunk_index);
  const auto hash  = Blake2b256Keyed(View(sector_id.Bytes()), {View(witness.ToBytes()), View(index)});

  ChunkOtp otp{};
  std::copy(hash.begin(), hash.begin() + otp.size(), otp.begin());
  return otp;
}

} // namespace farmer::crypto
