#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace farmer::util {

/*
  Hex helpers for keys, seeds and checkpoints on the command line and in logs.
*/

std::string ToHex(const uint8_t* data, std::size_t size);

template <std::size_t N>
std::string ToHex(const std::array<uint8_t, N>& bytes) {
  return ToHex(bytes.data(), bytes.size());
}

std::vector<uint8_t> FromHex(const std::string& str);

// Throws std::invalid_argument unless `str` decodes to exactly N bytes.
template <std::size_t N>
std::array<uint8_t, N> FromHexFixed(const std::string& str) {
  const auto bytes = FromHex(str);
  if (bytes.size() != N) {
    throw std::invalid_argument("expected " + std::to_string(N) + " hex-encoded bytes, got " + std::to_string(bytes.size()));
  }
  std::array<uint8_t, N> out{};
  for (std::size_t i = 0; i < N; ++i) out[i] = bytes[i];
  return out;
}

} // namespace farmer::util
