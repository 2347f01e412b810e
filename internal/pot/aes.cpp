#include "aes.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>

#include "internal/crypto/hash.hpp"
#include "internal/util/worker_pool.hpp"

namespace farmer::pot {

PotKey DeriveKey(const PotSeed& seed) {
  const auto hash = farmer::crypto::Sha256(farmer::crypto::View(seed));

  PotKey key{};
  std::copy(hash.begin(), hash.begin() + key.size(), key.begin());
  return key;
}

namespace aes {

namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// Single-block AES-128 in one direction; one instance per thread.
class BlockCipher {
 public:
  BlockCipher(const PotKey& key, bool encrypt) : ctx_(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free) {
    if (!ctx_) throw std::runtime_error(farmer::crypto::OpenSslErrorString("EVP_CIPHER_CTX_new failed"));

    if (EVP_CipherInit_ex(ctx_.get(), EVP_aes_128_ecb(), nullptr, key.data(), nullptr, encrypt ? 1 : 0) != 1 ||
        EVP_CIPHER_CTX_set_padding(ctx_.get(), 0) != 1) {
      throw std::runtime_error(farmer::crypto::OpenSslErrorString("AES-128 init failed"));
    }
  }

  void Apply(PotOutput& block, uint32_t times) {
    PotOutput out{};
    for (uint32_t i = 0; i < times; ++i) {
      int out_len = 0;
      if (EVP_CipherUpdate(ctx_.get(), out.data(), &out_len, block.data(), static_cast<int>(block.size())) != 1 ||
          out_len != static_cast<int>(block.size())) {
        throw std::runtime_error(farmer::crypto::OpenSslErrorString("AES-128 block operation failed"));
      }
      block = out;
    }
  }

 private:
  CipherCtxPtr ctx_;
};

} // namespace

PotCheckpoints Create(const PotSeed& seed, const PotKey& key, uint32_t checkpoint_iterations) {
  BlockCipher cipher(key, /*encrypt=*/true);

  PotCheckpoints checkpoints{};
  PotOutput      state = seed;
  for (auto& checkpoint : checkpoints) {
    cipher.Apply(state, checkpoint_iterations);
    checkpoint = state;
  }
  return checkpoints;
}

bool VerifySequential(const PotSeed& seed, const PotKey& key, const std::vector<PotOutput>& checkpoints, uint32_t checkpoint_iterations,
                      farmer::util::WorkerPool& pool) {
  if (checkpoint_iterations % 2 != 0) {
    throw std::invalid_argument("checkpoint iterations must be even");
  }
  const uint32_t half = checkpoint_iterations / 2;

  std::atomic<bool> valid{true};
  pool.ParallelFor(checkpoints.size(), 1, [&](std::size_t begin, std::size_t end) {
    BlockCipher forward(key, /*encrypt=*/true);
    BlockCipher backward(key, /*encrypt=*/false);

    for (std::size_t i = begin; i < end && valid.load(std::memory_order_relaxed); ++i) {
      PotOutput from_input      = i == 0 ? seed : checkpoints[i - 1];
      PotOutput from_checkpoint = checkpoints[i];

      forward.Apply(from_input, half);
      backward.Apply(from_checkpoint, half);

      if (from_input != from_checkpoint) valid.store(false, std::memory_order_relaxed);
    }
  });

  return valid.load();
}

} // namespace aes

} // namespace farmer::pot
