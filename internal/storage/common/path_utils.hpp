#pragma once

#include <filesystem>
#include <string>

#include "internal/model/piece.hpp"

namespace farmer::storage::common {

inline std::filesystem::path PiecePath(const std::filesystem::path& root, farmer::model::PieceIndex piece_index) {
  return root / (std::to_string(piece_index) + ".bin");
}

inline std::filesystem::path SectorPath(const std::filesystem::path& root, uint64_t sector_index) {
  return root / ("sector-" + std::to_string(sector_index) + ".bin");
}

inline std::filesystem::path SectorMetadataPath(const std::filesystem::path& root, uint64_t sector_index) {
  return root / ("sector-" + std::to_string(sector_index) + ".meta");
}

} // namespace farmer::storage::common
