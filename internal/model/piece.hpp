#pragma once

#include <arrow/buffer.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace farmer::model {

/*
  Pieces are fixed-size Arrow buffers: a record region followed by a
  KZG witness. Code handling pieces never owns raw byte pointers, only
  buffers.
*/
using Piece      = std::shared_ptr<arrow::Buffer>;
using PieceIndex = uint64_t;
using PublicKey  = std::array<uint8_t, 32>;

// Compressed BLS12-381 G1 point.
constexpr std::size_t kWitnessSize = 48;

struct PieceIndexHash {
  std::array<uint8_t, 32> bytes{};

  static PieceIndexHash FromIndex(PieceIndex index);

  bool operator==(const PieceIndexHash& other) const {
    return bytes == other.bytes;
  }
};

/*
  Identity of one sector of one farmer, derived from the farmer's public
  key and the sector index. Namespaces the pieces a sector stores and the
  one-time pads it is encoded with.
*/
class SectorId {
 public:
  SectorId(const PublicKey& public_key, uint64_t sector_index);

  /*
    Maps a slot of this sector to a piece of global history.

    Reproducible for fixed (sector, offset, total_pieces); throws
    std::invalid_argument when total_pieces is zero.
  */
  PieceIndex DerivePieceIndex(uint64_t piece_offset, uint64_t total_pieces) const;

  const std::array<uint8_t, 32>& Bytes() const {
    return bytes_;
  }

  bool operator==(const SectorId& other) const {
    return bytes_ == other.bytes_;
  }

 private:
  std::array<uint8_t, 32> bytes_{};
};

/*
  Snapshot of network parameters a sector is plotted against.
  Owned by the caller; read-only for the plotter.
*/
struct FarmerProtocolInfo {
  uint32_t record_size                   = 0;
  uint32_t recorded_history_segment_size = 0;
  uint64_t total_pieces                  = 0;
  // Chunk width in bits used for one-time-pad encoding.
  uint16_t space_l           = 0;
  uint64_t sector_expiration = 0;
};

// Throws std::invalid_argument on zero sizes or space_l outside 1..64.
void Validate(const FarmerProtocolInfo& info);

uint64_t PieceSize(const FarmerProtocolInfo& info);

// Sector size in bytes, rounded down to whole pieces.
uint64_t PlotSectorSize(const FarmerProtocolInfo& info);

uint64_t PiecesInSector(const FarmerProtocolInfo& info);

// Segment index after which a sector plotted now expires.
uint64_t ExpiresAt(const FarmerProtocolInfo& info, uint64_t replication_factor);

/*
  Written once after all pieces of a sector are plotted.

  Wire format: le64(total_pieces) || le64(expires_at).
*/
struct SectorMetadata {
  static constexpr std::size_t kEncodedSize = 16;

  uint64_t total_pieces = 0;
  uint64_t expires_at   = 0;

  std::array<uint8_t, kEncodedSize> Encode() const;

  // Throws std::invalid_argument unless size == kEncodedSize.
  static SectorMetadata Decode(const uint8_t* data, std::size_t size);

  bool operator==(const SectorMetadata& other) const {
    return total_pieces == other.total_pieces && expires_at == other.expires_at;
  }
};

} // namespace farmer::model
