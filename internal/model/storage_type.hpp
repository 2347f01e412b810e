#pragma once

#include <cstdint>
#include <string_view>

namespace farmer::model {

// Network storage tier a piece is requested from.
enum class StorageType : std::uint8_t {
  // L2 piece cache
  kCache = 0,
  // L1 archival storage
  kArchivalStorage = 1,
};

// Multihash codes of the per-tier content keys.
constexpr std::uint64_t kCacheMultihashCode           = 0xb39910;
constexpr std::uint64_t kArchivalStorageMultihashCode = 0xb39911;

constexpr std::uint64_t MultihashCode(StorageType type) {
  switch (type) {
    case StorageType::kArchivalStorage:
      return kArchivalStorageMultihashCode;
    case StorageType::kCache:
    default:
      return kCacheMultihashCode;
  }
}

constexpr std::string_view ToString(StorageType type) {
  switch (type) {
    case StorageType::kCache:
      return "cache";
    case StorageType::kArchivalStorage:
      return "archival";
    default:
      return "unspecified";
  }
}

} // namespace farmer::model
