#include "piece.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/crypto/hash.hpp"

namespace farmer::model {

using namespace farmer::crypto;

PieceIndexHash PieceIndexHash::FromIndex(PieceIndex index) {
  const auto encoded = LittleEndian64(index);
  return PieceIndexHash{Sha256(View(encoded))};
}

SectorId::SectorId(const PublicKey& public_key, uint64_t sector_index) {
  const auto encoded = LittleEndian64(sector_index);
  bytes_             = Blake2b256Keyed(View(public_key), {View(encoded)});
}

PieceIndex SectorId::DerivePieceIndex(uint64_t piece_offset, uint64_t total_pieces) const {
  if (total_pieces == 0) {
    throw std::invalid_argument("total_pieces must be non-zero");
  }

  const auto encoded = LittleEndian64(piece_offset);
  const auto hash    = Blake2b256Keyed(View(bytes_), {View(encoded)});

  // hash is a little-endian U256; reduce it modulo total_pieces from the top byte down.
  unsigned __int128 remainder = 0;
  for (auto it = hash.rbegin(); it != hash.rend(); ++it) {
    remainder = ((remainder << 8) | *it) % total_pieces;
  }
  return static_cast<PieceIndex>(remainder);
}

void Validate(const FarmerProtocolInfo& info) {
  if (info.record_size == 0) throw std::invalid_argument("record_size must be non-zero");
  if (info.recorded_history_segment_size == 0) throw std::invalid_argument("recorded_history_segment_size must be non-zero");
  if (info.total_pieces == 0) throw std::invalid_argument("total_pieces must be non-zero");
  if (info.space_l == 0 || info.space_l > 64) {
    throw std::invalid_argument("space_l must be in 1..64, got " + std::to_string(info.space_l));
  }
}

uint64_t PieceSize(const FarmerProtocolInfo& info) {
  return static_cast<uint64_t>(info.record_size) + kWitnessSize;
}

uint64_t PlotSectorSize(const FarmerProtocolInfo& info) {
  Validate(info);

  // 2^space_l chunks of space_l bits each.
  const unsigned __int128 bits  = (static_cast<unsigned __int128>(1) << info.space_l) * info.space_l;
  const unsigned __int128 bytes = bits / 8;
  if (bytes > std::numeric_limits<uint64_t>::max()) {
    throw std::invalid_argument("sector size overflows for space_l " + std::to_string(info.space_l));
  }

  const uint64_t piece_size = PieceSize(info);
  return static_cast<uint64_t>(bytes) / piece_size * piece_size;
}

uint64_t PiecesInSector(const FarmerProtocolInfo& info) {
  return PlotSectorSize(info) / PieceSize(info);
}

uint64_t ExpiresAt(const FarmerProtocolInfo& info, uint64_t replication_factor) {
  Validate(info);

  const uint64_t current_segment_index =
      info.total_pieces / info.recorded_history_segment_size / info.record_size * replication_factor;
  return current_segment_index + info.sector_expiration;
}

std::array<uint8_t, SectorMetadata::kEncodedSize> SectorMetadata::Encode() const {
  std::array<uint8_t, kEncodedSize> out{};
  const auto                        total   = LittleEndian64(total_pieces);
  const auto                        expires = LittleEndian64(expires_at);
  std::copy(total.begin(), total.end(), out.begin());
  std::copy(expires.begin(), expires.end(), out.begin() + total.size());
  return out;
}

SectorMetadata SectorMetadata::Decode(const uint8_t* data, std::size_t size) {
  if (size != kEncodedSize) {
    throw std::invalid_argument("sector metadata must be " + std::to_string(kEncodedSize) + " bytes, got " + std::to_string(size));
  }

  auto read_le64 = [data](std::size_t offset) {
    uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    return value;
  };

  SectorMetadata metadata;
  metadata.total_pieces = read_le64(0);
  metadata.expires_at   = read_le64(8);
  return metadata;
}

} // namespace farmer::model
