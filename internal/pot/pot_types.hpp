#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace farmer::pot {

// One AES-128 block each.
using PotSeed   = std::array<uint8_t, 16>;
using PotKey    = std::array<uint8_t, 16>;
using PotOutput = std::array<uint8_t, 16>;

constexpr std::size_t kNumCheckpoints = 8;

// Outputs at each of the kNumCheckpoints evenly spaced points of the chain.
using PotCheckpoints = std::array<PotOutput, kNumCheckpoints>;

// AES key used to run the chain for `seed`: first 16 bytes of SHA-256(seed).
PotKey DeriveKey(const PotSeed& seed);

} // namespace farmer::pot
