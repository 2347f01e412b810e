#include "plotting.hpp"

#include <arrow/buffer.h>

#include <cstring>
#include <utility>

#include "internal/crypto/witness.hpp"
#include "internal/observability/logging.hpp"
#include "internal/plotting/sector_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/worker_pool.hpp"

namespace farmer::plotting {

using namespace farmer::model;
using farmer::observability::UintField;

namespace {

void WriteAll(arrow::io::OutputStream& out, const void* data, int64_t size, const char* what) {
  const auto status = out.Write(data, size);
  if (!status.ok()) {
    throw PlottingIoError(std::string("failed to write ") + what + ": " + status.ToString());
  }
}

// Copy of the fetched piece we may encode in place.
std::shared_ptr<arrow::Buffer> MutableCopy(const Piece& piece) {
  auto result = arrow::AllocateBuffer(piece->size());
  if (!result.ok()) throw std::runtime_error("piece buffer allocation failed: " + result.status().ToString());

  std::shared_ptr<arrow::Buffer> copy = std::move(*result);
  if (piece->size() > 0) std::memcpy(copy->mutable_data(), piece->data(), static_cast<size_t>(piece->size()));
  return copy;
}

} // namespace

FailedToRetrievePiece::FailedToRetrievePiece(PieceIndex piece_index, std::string cause)
    : PlottingError("Failed to retrieve piece " + std::to_string(piece_index) + ": " + cause),
      piece_index_(piece_index),
      cause_(std::move(cause)) {
}

PieceNotFound::PieceNotFound(PieceIndex piece_index)
    : PlottingError("Piece " + std::to_string(piece_index) + " not found"), piece_index_(piece_index) {
}

Plotter::Plotter(std::shared_ptr<farmer::util::WorkerPool> pool, PlottingOptions options) : pool_(std::move(pool)), options_(options) {
  if (!pool_) throw std::invalid_argument("Plotter requires a worker pool");
}

PlottingStatus Plotter::PlotSector(const PublicKey& public_key, uint64_t sector_index, farmer::dsn::PieceReceiver& piece_receiver,
                                   const std::atomic<bool>& shutting_down, const FarmerProtocolInfo& protocol_info,
                                   arrow::io::OutputStream& sector, arrow::io::OutputStream& sector_metadata) const {
  const SectorId sector_id(public_key, sector_index);
  const uint64_t pieces_in_sector = PiecesInSector(protocol_info);
  const uint64_t expires_at       = ExpiresAt(protocol_info, options_.replication_factor);
  const uint64_t piece_size       = PieceSize(protocol_info);
  const size_t   record_size      = protocol_info.record_size;

  for (uint64_t piece_offset = 0; piece_offset < pieces_in_sector; ++piece_offset) {
    if (shutting_down.load(std::memory_order_acquire)) {
      FARMER_LOG_DEBUG("Instance is shutting down, interrupting plotting",
                       {UintField("sector_index", sector_index), UintField("piece_offset", piece_offset)});
      return PlottingStatus::kInterrupted;
    }

    const PieceIndex piece_index = sector_id.DerivePieceIndex(piece_offset, protocol_info.total_pieces);

    std::optional<Piece> maybe_piece;
    try {
      maybe_piece = piece_receiver.GetPiece(piece_index);
    } catch (const std::exception& e) {
      throw FailedToRetrievePiece(piece_index, e.what());
    }
    if (!maybe_piece || !*maybe_piece) {
      throw PieceNotFound(piece_index);
    }
    const Piece& piece = *maybe_piece;

    if (static_cast<uint64_t>(piece->size()) != piece_size) {
      farmer::util::AbortOnProtocolViolation("piece " + std::to_string(piece_index) + " is " + std::to_string(piece->size()) +
                                             " bytes, expected " + std::to_string(piece_size) + "; must be a bug on the node");
    }

    auto encoded = MutableCopy(piece);

    std::optional<farmer::crypto::Witness> witness;
    try {
      witness = farmer::crypto::Witness::FromBytes(encoded->data() + record_size, kWitnessSize);
    } catch (const farmer::crypto::WitnessDecodeError& e) {
      farmer::util::AbortOnProtocolViolation("failed to decode witness for piece " + std::to_string(piece_index) +
                                             ", must be a bug on the node: " + e.what());
    }

    EncodeRecord(encoded->mutable_data(), record_size, protocol_info.space_l, sector_id, *witness, *pool_);

    WriteAll(sector, encoded->data(), encoded->size(), "sector");
  }

  const auto metadata = SectorMetadata{protocol_info.total_pieces, expires_at}.Encode();
  WriteAll(sector_metadata, metadata.data(), static_cast<int64_t>(metadata.size()), "sector metadata");

  FARMER_LOG_DEBUG("Sector plotted", {UintField("sector_index", sector_index), UintField("pieces", pieces_in_sector),
                                      UintField("expires_at", expires_at)});
  return PlottingStatus::kPlottedSuccessfully;
}

} // namespace farmer::plotting
