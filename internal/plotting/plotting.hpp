#pragma once

#include <arrow/io/interfaces.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/dsn/piece_receiver.hpp"
#include "internal/model/piece.hpp"

namespace farmer::util {
class WorkerPool;
}

namespace farmer::plotting {

/*
  Fatal plotting errors. Any of them aborts the sector; the caller
  decides whether to discard and restart it.
*/
class PlottingError : public std::runtime_error {
 public:
  explicit PlottingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FailedToRetrievePiece : public PlottingError {
 public:
  FailedToRetrievePiece(farmer::model::PieceIndex piece_index, std::string cause);

  farmer::model::PieceIndex piece_index() const {
    return piece_index_;
  }

  const std::string& cause() const {
    return cause_;
  }

 private:
  farmer::model::PieceIndex piece_index_;
  std::string               cause_;
};

class PieceNotFound : public PlottingError {
 public:
  explicit PieceNotFound(farmer::model::PieceIndex piece_index);

  farmer::model::PieceIndex piece_index() const {
    return piece_index_;
  }

 private:
  farmer::model::PieceIndex piece_index_;
};

// Writing to the sector or metadata sink failed.
class PlottingIoError : public PlottingError {
 public:
  explicit PlottingIoError(const std::string& msg) : PlottingError(msg) {
  }
};

enum class PlottingStatus {
  kPlottedSuccessfully,
  // Shutdown was requested; the sector is partially written and has no metadata.
  kInterrupted,
};

struct PlottingOptions {
  // History replication assumed when converting piece counts to segment indexes.
  uint64_t replication_factor = 2;
};

/*
  Plots sectors: derives a sector's pieces, fetches them one slot at a
  time, encodes each record with its one-time pads and appends the
  result to the sector sink.

  Blocking and CPU heavy; run it off latency-sensitive threads.
*/
class Plotter {
 public:
  explicit Plotter(std::shared_ptr<farmer::util::WorkerPool> pool, PlottingOptions options = {});

  /*
    Plots one sector. `sector` and `sector_metadata` must already be
    positioned; they are only appended to.

    `shutting_down` is polled before every slot. Throws a PlottingError
    subclass on fetch or sink failure, std::invalid_argument on bad
    protocol info, and aborts the process on an undecodable witness.
  */
  PlottingStatus PlotSector(const farmer::model::PublicKey& public_key, uint64_t sector_index, farmer::dsn::PieceReceiver& piece_receiver,
                            const std::atomic<bool>& shutting_down, const farmer::model::FarmerProtocolInfo& protocol_info,
                            arrow::io::OutputStream& sector, arrow::io::OutputStream& sector_metadata) const;

 private:
  std::shared_ptr<farmer::util::WorkerPool> pool_;
  PlottingOptions                           options_;
};

} // namespace farmer::plotting
