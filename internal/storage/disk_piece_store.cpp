#include "disk_piece_store.hpp"

#include <arrow/io/file.h>

#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace farmer::storage {

using namespace farmer::storage::common;
using farmer::model::Piece;
using farmer::model::PieceIndex;

DiskPieceStore::DiskPieceStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::optional<Piece> DiskPieceStore::GetPiece(PieceIndex piece_index) {
  const auto path = PiecePath(root_, piece_index);
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskPieceStore::Write(PieceIndex piece_index, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  auto final_path = PiecePath(root_, piece_index);
  auto tmp_path   = final_path.string() + ".tmp";

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync) Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::filesystem::rename(tmp_path, final_path);
}

void DiskPieceStore::Remove(PieceIndex piece_index) {
  std::filesystem::remove(PiecePath(root_, piece_index));
}

} // namespace farmer::storage
