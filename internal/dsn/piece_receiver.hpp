#pragma once

#include <optional>

#include "internal/dsn/node.hpp"
#include "internal/model/piece.hpp"

namespace farmer::dsn {

/*
  Source of pieces by global index.

  Returns std::nullopt when no piece was found. Failures are reported by
  throwing; the plotter wraps them into FailedToRetrievePiece.
*/
class PieceReceiver {
 public:
  virtual ~PieceReceiver() = default;

  virtual std::optional<farmer::model::Piece> GetPiece(farmer::model::PieceIndex piece_index) = 0;
};

/*
  Optional check applied to every piece a peer returns.

  The result is authoritative: std::nullopt rejects the piece and the
  lookup in that tier ends without a piece.
*/
class PieceValidator {
 public:
  virtual ~PieceValidator() = default;

  virtual std::optional<farmer::model::Piece> ValidatePiece(const PeerId& source_peer, farmer::model::PieceIndex piece_index,
                                                            farmer::model::Piece piece) = 0;
};

} // namespace farmer::dsn
