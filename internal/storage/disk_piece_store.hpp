#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <optional>

#include "internal/dsn/piece_receiver.hpp"
#include "internal/model/piece.hpp"

namespace farmer::storage {

/*
  Pieces staged on local disk, one file per piece index.

  Properties:
    - atomic replace writes (tmp + rename)
    - optional fsync
    - missing pieces read as "not found", not as errors
*/
class DiskPieceStore final : public farmer::dsn::PieceReceiver {
 public:
  explicit DiskPieceStore(std::filesystem::path root);

  std::optional<farmer::model::Piece> GetPiece(farmer::model::PieceIndex piece_index) override;

  void Write(farmer::model::PieceIndex piece_index, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync);

  void Remove(farmer::model::PieceIndex piece_index);

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace farmer::storage
