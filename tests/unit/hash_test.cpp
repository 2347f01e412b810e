#include "internal/crypto/hash.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/dsn/node.hpp"
#include "internal/model/piece.hpp"
#include "internal/model/storage_type.hpp"
#include "internal/util/hex.hpp"

namespace {

using farmer::crypto::Blake2b256Keyed;
using farmer::crypto::ByteView;
using farmer::crypto::Sha256;
using farmer::crypto::View;
using farmer::model::PublicKey;
using farmer::model::SectorId;

ByteView Text(const std::string& text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

void TestSha256KnownAnswers() {
  assert(farmer::util::ToHex(Sha256(Text("abc"))) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(farmer::util::ToHex(Sha256(Text(""))) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestBlake2bKeyedParts() {
  const std::string key = "sector-key";

  const auto whole = Blake2b256Keyed(Text(key), {Text("hello world")});
  const auto split = Blake2b256Keyed(Text(key), {Text("hello "), Text(""), Text("world")});
  assert(whole == split);

  assert(whole != Blake2b256Keyed(Text("other-key"), {Text("hello world")}));
  assert(whole != Blake2b256Keyed(Text(key), {Text("hello world!")}));

  bool threw = false;
  try {
    (void)Blake2b256Keyed(Text(""), {Text("data")});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "empty key must be rejected");
}

void TestLittleEndianEncodings() {
  const auto le64 = farmer::crypto::LittleEndian64(0x0102030405060708ULL);
  assert(farmer::util::ToHex(le64) == "0807060504030201");

  const auto le32 = farmer::crypto::LittleEndian32(0x0a0b0c0d);
  assert(farmer::util::ToHex(le32) == "0d0c0b0a");
}

void TestSectorIdDerivation() {
  PublicKey key_a{};
  key_a.fill(0x11);
  PublicKey key_b{};
  key_b.fill(0x22);

  const auto encoded = farmer::crypto::LittleEndian64(7);
  assert(SectorId(key_a, 7).Bytes() == Blake2b256Keyed(View(key_a), {View(encoded)}));

  assert(SectorId(key_a, 7) == SectorId(key_a, 7));
  assert(!(SectorId(key_a, 7) == SectorId(key_a, 8)));
  assert(!(SectorId(key_a, 7) == SectorId(key_b, 7)));
}

void TestDerivePieceIndex() {
  PublicKey key{};
  key.fill(0x33);
  const SectorId sector_id(key, 0);

  std::set<uint64_t> indices;
  for (uint64_t offset = 0; offset < 64; ++offset) {
    const auto index = sector_id.DerivePieceIndex(offset, 1000);
    assert(index < 1000);
    assert(index == sector_id.DerivePieceIndex(offset, 1000));
    indices.insert(index);
  }
  assert(indices.size() > 32);

  assert(sector_id.DerivePieceIndex(5, 1) == 0);

  bool threw = false;
  try {
    (void)sector_id.DerivePieceIndex(0, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestPieceIndexHash() {
  const auto encoded = farmer::crypto::LittleEndian64(42);
  assert(farmer::model::PieceIndexHash::FromIndex(42).bytes == Sha256(View(encoded)));
  assert(!(farmer::model::PieceIndexHash::FromIndex(42) == farmer::model::PieceIndexHash::FromIndex(43)));
}

void TestContentKeys() {
  const auto hash = farmer::model::PieceIndexHash::FromIndex(1);

  const auto cache    = farmer::dsn::MakeContentKey(hash, farmer::model::StorageType::kCache);
  const auto archival = farmer::dsn::MakeContentKey(hash, farmer::model::StorageType::kArchivalStorage);

  // uvarint(0xb39910) = 90 b2 ce 05, uvarint(32) = 20.
  assert(farmer::util::ToHex(cache.data(), 5) == "90b2ce0520");
  assert(farmer::util::ToHex(archival.data(), 5) == "91b2ce0520");
  assert(cache.size() == 5 + 32);
  assert(std::equal(hash.bytes.begin(), hash.bytes.end(), cache.begin() + 5));
}

void TestProtocolGeometry() {
  farmer::model::FarmerProtocolInfo info;
  info.record_size                   = 4;
  info.recorded_history_segment_size = 8;
  info.total_pieces                  = 1000;
  info.space_l                       = 8;
  info.sector_expiration             = 5;

  // 2^8 * 8 / 8 = 256 bytes of 52-byte pieces.
  assert(farmer::model::PieceSize(info) == 52);
  assert(farmer::model::PlotSectorSize(info) == 208);
  assert(farmer::model::PiecesInSector(info) == 4);

  // 1000 / 8 / 4 * 2 + 5
  assert(farmer::model::ExpiresAt(info, 2) == 67);
  assert(farmer::model::ExpiresAt(info, 3) == 98);

  info.space_l = 65;
  bool threw   = false;
  try {
    farmer::model::Validate(info);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSectorMetadataEncoding() {
  const farmer::model::SectorMetadata metadata{0x0102, 0x0a0b};
  const auto                          encoded = metadata.Encode();

  assert(farmer::util::ToHex(encoded) == "02010000000000000b0a000000000000");
  assert(farmer::model::SectorMetadata::Decode(encoded.data(), encoded.size()) == metadata);

  bool threw = false;
  try {
    (void)farmer::model::SectorMetadata::Decode(encoded.data(), encoded.size() - 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestHexParsing() {
  assert(farmer::util::FromHex("0x0aFF") == std::vector<uint8_t>({0x0a, 0xff}));

  bool threw = false;
  try {
    (void)farmer::util::FromHexFixed<2>("0a");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSha256KnownAnswers();
  TestBlake2bKeyedParts();
  TestLittleEndianEncodings();
  TestSectorIdDerivation();
  TestDerivePieceIndex();
  TestPieceIndexHash();
  TestContentKeys();
  TestProtocolGeometry();
  TestSectorMetadataEncoding();
  TestHexParsing();

  std::cout << "farmer_unit_hash: pass\n";
  return 0;
}
