#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "internal/dsn/backoff.hpp"
#include "internal/dsn/node.hpp"
#include "internal/dsn/piece_receiver.hpp"
#include "internal/model/storage_type.hpp"

namespace farmer::dsn {

struct RetrievalOptions {
  // Head start the cache tier gets before archival storage is queried.
  std::chrono::milliseconds archival_storage_delay{2000};
  // Bound on one race, measured from its start.
  std::chrono::milliseconds lookup_timeout{5000};

  BackoffOptions backoff;
};

/*
  Resolves a piece index to bytes over the DSN.

  Every attempt races the cache tier against archival storage (which
  starts after `archival_storage_delay`) and takes whichever yields a
  piece first. Empty or timed-out attempts are retried with exponential
  backoff until a piece arrives or `cancelled` is observed set, which
  throws util::Cancelled.

  Lookups run on detached threads holding their own references to the
  node and validator, so a losing branch can finish after GetPiece has
  returned.
*/
class PieceProvider final : public PieceReceiver {
 public:
  PieceProvider(std::shared_ptr<DsnNode> node, std::shared_ptr<PieceValidator> validator, const std::atomic<bool>& cancelled,
                RetrievalOptions options = {});

  std::optional<farmer::model::Piece> GetPiece(farmer::model::PieceIndex piece_index) override;

 private:
  void CheckCancellation() const;

  std::optional<farmer::model::Piece> RaceStorageTiers(farmer::model::PieceIndex piece_index) const;

  std::shared_ptr<DsnNode>        node_;
  std::shared_ptr<PieceValidator> validator_;
  const std::atomic<bool>&        cancelled_;
  RetrievalOptions                options_;
};

/*
  Single lookup in one storage tier: asks each provider of the tier's
  content key in turn until one returns a piece.
  Returns std::nullopt when providers are exhausted; never throws for
  network failures.
*/
std::optional<farmer::model::Piece> GetPieceFromStorage(DsnNode& node, PieceValidator* validator, farmer::model::PieceIndex piece_index,
                                                        farmer::model::StorageType storage_type);

} // namespace farmer::dsn
