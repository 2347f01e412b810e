#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/piece.hpp"
#include "internal/model/storage_type.hpp"

namespace farmer::dsn {

using PeerId = std::string;

// Multihash of a piece index hash, tagged with the tier's code.
using ContentKey = std::vector<uint8_t>;

ContentKey MakeContentKey(const farmer::model::PieceIndexHash& hash, farmer::model::StorageType type);

// Payload of a piece-by-hash request to a single peer.
struct PieceKey {
  farmer::model::StorageType    storage_type;
  farmer::model::PieceIndexHash piece_index_hash;
};

/*
  Lazily produced sequence of peers providing a content key.
  May be empty; may block while the network is queried.
*/
class ProviderStream {
 public:
  virtual ~ProviderStream() = default;

  // std::nullopt once the sequence is exhausted.
  virtual std::optional<PeerId> Next() = 0;
};

/*
  Network capability consumed by the piece provider. Implementations
  wrap the peer-to-peer transport; this core never sees it directly.

  Both calls may throw on network failure; the provider treats any
  exception as a retryable failure of that one call.
*/
class DsnNode {
 public:
  virtual ~DsnNode() = default;

  virtual std::unique_ptr<ProviderStream> GetProviders(const ContentKey& key) = 0;

  // Piece returned by `peer`, or std::nullopt when it had none.
  virtual std::optional<farmer::model::Piece> SendPieceByHashRequest(const PeerId& peer, const PieceKey& key) = 0;
};

} // namespace farmer::dsn
