#include "witness.hpp"

#include <openssl/bn.h>
#include <openssl/err.h>

#include <algorithm>
#include <memory>

#include "internal/crypto/hash.hpp"

namespace farmer::crypto {

namespace {

constexpr uint8_t kCompressionFlag = 0x80;
constexpr uint8_t kInfinityFlag    = 0x40;
constexpr uint8_t kSignFlag        = 0x20;
constexpr uint8_t kFlagMask        = kCompressionFlag | kInfinityFlag | kSignFlag;

// BLS12-381 base field modulus.
constexpr const char* kFieldModulusHex =
    "1a0111ea397fe69a4b1ba7b6434bacd764774b84f38512bf6730d2a0f6b0f6241eabfffeb153ffffb9feffffffffaaab";

using BnPtr    = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

BnPtr NewBn() {
  BnPtr bn(BN_new(), &BN_free);
  if (!bn) throw std::runtime_error(OpenSslErrorString("BN_new failed"));
  return bn;
}

const BIGNUM* FieldModulus() {
  static const BnPtr modulus = [] {
    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, kFieldModulusHex) == 0) throw std::runtime_error(OpenSslErrorString("BN_hex2bn failed"));
    return BnPtr(raw, &BN_free);
  }();
  return modulus.get();
}

// True when x^3 + 4 is a square mod p, i.e. some y puts (x, y) on the curve.
bool IsOnCurve(const BIGNUM* x) {
  BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
  if (!ctx) throw std::runtime_error(OpenSslErrorString("BN_CTX_new failed"));

  const BIGNUM* p   = FieldModulus();
  auto          rhs = NewBn();
  auto          b   = NewBn();
  auto          y   = NewBn();

  if (BN_mod_sqr(rhs.get(), x, p, ctx.get()) != 1 || BN_mod_mul(rhs.get(), rhs.get(), x, p, ctx.get()) != 1 ||
      BN_set_word(b.get(), 4) != 1 || BN_mod_add(rhs.get(), rhs.get(), b.get(), p, ctx.get()) != 1) {
    throw std::runtime_error(OpenSslErrorString("curve equation evaluation failed"));
  }

  // BN_mod_sqrt fails with "not a square" for non-residues; that is an answer, not an error.
  const bool on_curve = BN_mod_sqrt(y.get(), rhs.get(), p, ctx.get()) != nullptr;
  if (!on_curve) ERR_clear_error();
  return on_curve;
}

} // namespace

Witness Witness::FromBytes(const uint8_t* data, std::size_t size) {
  if (size != farmer::model::kWitnessSize) {
    throw WitnessDecodeError("witness must be " + std::to_string(farmer::model::kWitnessSize) + " bytes, got " + std::to_string(size));
  }

  Bytes bytes{};
  std::copy(data, data + size, bytes.begin());

  const uint8_t flags = bytes[0] & kFlagMask;
  if ((flags & kCompressionFlag) == 0) {
    throw WitnessDecodeError("witness is not a compressed point");
  }

  if (flags & kInfinityFlag) {
    const bool canonical = (flags & kSignFlag) == 0 && (bytes[0] & ~kFlagMask) == 0 &&
                           std::all_of(bytes.begin() + 1, bytes.end(), [](uint8_t b) { return b == 0; });
    if (!canonical) throw WitnessDecodeError("non-canonical encoding of the point at infinity");
    return Witness(bytes);
  }

  Bytes x_bytes = bytes;
  x_bytes[0] &= static_cast<uint8_t>(~kFlagMask);

  BnPtr x(BN_bin2bn(x_bytes.data(), static_cast<int>(x_bytes.size()), nullptr), &BN_free);
  if (!x) throw std::runtime_error(OpenSslErrorString("BN_bin2bn failed"));

  if (BN_cmp(x.get(), FieldModulus()) >= 0) {
    throw WitnessDecodeError("witness x coordinate is not a field element");
  }
  if (!IsOnCurve(x.get())) {
    throw WitnessDecodeError("witness is not on the BLS12-381 G1 curve");
  }

  return Witness(bytes);
}

bool Witness::IsInfinity() const {
  return (bytes_[0] & kInfinityFlag) != 0;
}

} // namespace farmer::crypto
