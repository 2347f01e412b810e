#include "node.hpp"

namespace farmer::dsn {

namespace {

void AppendUvarint(ContentKey& out, uint64_t value) {
  while (value >= 0x80) {
    out.push_back(static_cast<uint8_t>(value | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<uint8_t>(value));
}

} // namespace

ContentKey MakeContentKey(const farmer::model::PieceIndexHash& hash, farmer::model::StorageType type) {
  ContentKey key;
  key.reserve(hash.bytes.size() + 6);
  AppendUvarint(key, farmer::model::MultihashCode(type));
  AppendUvarint(key, hash.bytes.size());
  key.insert(key.end(), hash.bytes.begin(), hash.bytes.end());
  return key;
}

} // namespace farmer::dsn
