#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace farmer::crypto {

using Hash256 = std::array<uint8_t, 32>;

// Non-owning view over bytes passed to the hash functions.
struct ByteView {
  const uint8_t* data;
  std::size_t    size;
};

template <std::size_t N>
ByteView View(const std::array<uint8_t, N>& bytes) {
  return {bytes.data(), bytes.size()};
}

/*
  BLAKE2b with a 32-byte digest, keyed (BLAKE2b MAC).

  `key` must be 1..64 bytes. `parts` are hashed as one concatenated message.
*/
Hash256 Blake2b256Keyed(ByteView key, std::initializer_list<ByteView> parts);

Hash256 Sha256(ByteView data);

// Little-endian encodings used as hash inputs.
std::array<uint8_t, 8> LittleEndian64(uint64_t value);
std::array<uint8_t, 4> LittleEndian32(uint32_t value);

// Formats the pending OpenSSL error queue, prefixed with `context`, and clears it.
std::string OpenSslErrorString(const std::string& context);

} // namespace farmer::crypto
