#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/model/piece.hpp"

namespace farmer::crypto {

class WitnessDecodeError : public std::runtime_error {
 public:
  explicit WitnessDecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  KZG witness: a compressed BLS12-381 G1 point binding a piece to its
  position in the history commitment.

  Decoding checks the compressed encoding (flag bits, canonical
  infinity, x below the field modulus) and that x lies on the curve
  y^2 = x^3 + 4. Subgroup membership is not checked.
*/
class Witness {
 public:
  using Bytes = std::array<uint8_t, farmer::model::kWitnessSize>;

  // Throws WitnessDecodeError on malformed input, including size != kWitnessSize.
  static Witness FromBytes(const uint8_t* data, std::size_t size);

  const Bytes& ToBytes() const {
    return bytes_;
  }

  bool IsInfinity() const;

 private:
  explicit Witness(const Bytes& bytes) : bytes_(bytes) {
  }

  Bytes bytes_;
};

} // namespace farmer::crypto
