#include "hash.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <memory>
#include <stdexcept>

namespace farmer::crypto {

namespace {

using MacPtr    = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

// Fetched once; EVP_MAC objects are immutable and safe to share across threads.
EVP_MAC* Blake2bMac() {
  static MacPtr mac(EVP_MAC_fetch(nullptr, "BLAKE2BMAC", nullptr), &EVP_MAC_free);
  if (!mac) throw std::runtime_error(OpenSslErrorString("BLAKE2BMAC unavailable"));
  return mac.get();
}

} // namespace

std::string OpenSslErrorString(const std::string& context) {
  std::string message = context;
  while (const unsigned long code = ERR_get_error()) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    message += ": ";
    message += buf;
  }
  return message;
}

Hash256 Blake2b256Keyed(ByteView key, std::initializer_list<ByteView> parts) {
  if (key.size == 0 || key.size > 64) {
    throw std::invalid_argument("BLAKE2b key must be 1..64 bytes");
  }

  MacCtxPtr ctx(EVP_MAC_CTX_new(Blake2bMac()), &EVP_MAC_CTX_free);
  if (!ctx) throw std::runtime_error(OpenSslErrorString("EVP_MAC_CTX_new failed"));

  size_t     digest_size = 32;
  OSSL_PARAM params[]    = {OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &digest_size), OSSL_PARAM_construct_end()};

  if (EVP_MAC_init(ctx.get(), key.data, key.size, params) != 1) {
    throw std::runtime_error(OpenSslErrorString("BLAKE2b init failed"));
  }

  for (const auto& part : parts) {
    if (part.size == 0) continue;
    if (EVP_MAC_update(ctx.get(), part.data, part.size) != 1) {
      throw std::runtime_error(OpenSslErrorString("BLAKE2b update failed"));
    }
  }

  Hash256 out{};
  size_t  out_len = 0;
  if (EVP_MAC_final(ctx.get(), out.data(), &out_len, out.size()) != 1 || out_len != out.size()) {
    throw std::runtime_error(OpenSslErrorString("BLAKE2b final failed"));
  }
  return out;
}

Hash256 Sha256(ByteView data) {
  Hash256      out{};
  unsigned int out_len = 0;
  if (EVP_Digest(data.data, data.size, out.data(), &out_len, EVP_sha256(), nullptr) != 1 || out_len != out.size()) {
    throw std::runtime_error(OpenSslErrorString("SHA-256 failed"));
  }
  return out;
}

std::array<uint8_t, 8> LittleEndian64(uint64_t value) {
  std::array<uint8_t, 8> out{};
  for (size_t i = 0; i < out.size(); ++i) out[i] = static_cast<uint8_t>(value >> (8 * i));
  return out;
}

std::array<uint8_t, 4> LittleEndian32(uint32_t value) {
  std::array<uint8_t, 4> out{};
  for (size_t i = 0; i < out.size(); ++i) out[i] = static_cast<uint8_t>(value >> (8 * i));
  return out;
}

} // namespace farmer::crypto
