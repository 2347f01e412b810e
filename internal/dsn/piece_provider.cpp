#include "piece_provider.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace farmer::dsn {

using farmer::model::Piece;
using farmer::model::PieceIndex;
using farmer::model::PieceIndexHash;
using farmer::model::StorageType;
using farmer::observability::StringField;
using farmer::observability::UintField;

namespace {

/*
  Shared between one race and its two lookup threads. The first piece
  deposited wins; once `settled` is set late results are dropped and a
  branch still waiting out its start delay skips its lookup.
*/
struct RaceState {
  std::mutex              mutex;
  std::condition_variable cv;
  std::optional<Piece>    piece;
  int                     pending = 2;
  bool                    settled = false;
};

void Deposit(RaceState& state, std::optional<Piece> piece) {
  std::lock_guard lock(state.mutex);
  if (piece && !state.piece && !state.settled) {
    state.piece = std::move(piece);
  }
  --state.pending;
  state.cv.notify_all();
}

void RunLookup(std::shared_ptr<RaceState> state, std::shared_ptr<DsnNode> node, std::shared_ptr<PieceValidator> validator,
               PieceIndex piece_index, StorageType storage_type, std::chrono::milliseconds start_delay) {
  if (start_delay.count() > 0) {
    std::unique_lock lock(state->mutex);
    if (state->cv.wait_for(lock, start_delay, [&] { return state->settled; })) {
      --state->pending;
      return;
    }
  }

  std::optional<Piece> piece;
  try {
    piece = GetPieceFromStorage(*node, validator.get(), piece_index, storage_type);
  } catch (const std::exception& e) {
    FARMER_LOG_WARN("Piece lookup failed", {UintField("piece_index", piece_index), StringField("storage", farmer::model::ToString(storage_type)),
                                            StringField("error", e.what())});
  }

  Deposit(*state, std::move(piece));
}

} // namespace

std::optional<Piece> GetPieceFromStorage(DsnNode& node, PieceValidator* validator, PieceIndex piece_index, StorageType storage_type) {
  const auto     piece_index_hash = PieceIndexHash::FromIndex(piece_index);
  const auto     key              = MakeContentKey(piece_index_hash, storage_type);
  const PieceKey piece_key{storage_type, piece_index_hash};
  const auto     storage = farmer::model::ToString(storage_type);

  std::unique_ptr<ProviderStream> providers;
  try {
    providers = node.GetProviders(key);
  } catch (const std::exception& e) {
    FARMER_LOG_WARN("get_providers returned an error",
                    {UintField("piece_index", piece_index), StringField("storage", storage), StringField("error", e.what())});
    return std::nullopt;
  }
  if (!providers) return std::nullopt;

  for (;;) {
    std::optional<PeerId> provider_id;
    try {
      provider_id = providers->Next();
    } catch (const std::exception& e) {
      FARMER_LOG_WARN("Provider stream failed",
                      {UintField("piece_index", piece_index), StringField("storage", storage), StringField("error", e.what())});
      break;
    }
    if (!provider_id) break;

    FARMER_LOG_TRACE("get_providers returned an item", {UintField("piece_index", piece_index), StringField("provider_id", *provider_id)});

    std::optional<Piece> piece;
    try {
      piece = node.SendPieceByHashRequest(*provider_id, piece_key);
    } catch (const std::exception& e) {
      FARMER_LOG_WARN("Piece request failed.", {StringField("provider_id", *provider_id), UintField("piece_index", piece_index),
                                                StringField("storage", storage), StringField("error", e.what())});
      continue;
    }

    if (!piece || !*piece) {
      FARMER_LOG_DEBUG("Piece request returned empty piece.",
                       {StringField("provider_id", *provider_id), UintField("piece_index", piece_index), StringField("storage", storage)});
      continue;
    }

    FARMER_LOG_TRACE("Piece request succeeded.",
                     {StringField("provider_id", *provider_id), UintField("piece_index", piece_index), StringField("storage", storage)});

    if (validator) {
      return validator->ValidatePiece(*provider_id, piece_index, std::move(*piece));
    }
    return piece;
  }

  return std::nullopt;
}

PieceProvider::PieceProvider(std::shared_ptr<DsnNode> node, std::shared_ptr<PieceValidator> validator, const std::atomic<bool>& cancelled,
                             RetrievalOptions options)
    : node_(std::move(node)), validator_(std::move(validator)), cancelled_(cancelled), options_(std::move(options)) {
  if (!node_) throw std::invalid_argument("PieceProvider requires a DSN node");
}

void PieceProvider::CheckCancellation() const {
  if (cancelled_.load(std::memory_order_acquire)) {
    FARMER_LOG_DEBUG("Getting a piece was cancelled.");
    throw farmer::util::Cancelled("Getting a piece was cancelled.");
  }
}

std::optional<Piece> PieceProvider::RaceStorageTiers(PieceIndex piece_index) const {
  auto       state    = std::make_shared<RaceState>();
  const auto deadline = farmer::util::Now() + options_.lookup_timeout;

  std::thread(RunLookup, state, node_, validator_, piece_index, StorageType::kCache, std::chrono::milliseconds{0}).detach();
  std::thread(RunLookup, state, node_, validator_, piece_index, StorageType::kArchivalStorage, options_.archival_storage_delay).detach();

  std::optional<Piece> piece;
  {
    std::unique_lock lock(state->mutex);
    state->cv.wait_until(lock, deadline, [&] { return state->piece.has_value() || state->pending == 0; });
    state->settled = true;
    piece          = std::move(state->piece);
    state->piece.reset();
  }
  // Wakes a branch still sleeping out its start delay.
  state->cv.notify_all();

  return piece;
}

std::optional<Piece> PieceProvider::GetPiece(PieceIndex piece_index) {
  FARMER_LOG_TRACE("Piece request.", {UintField("piece_index", piece_index)});

  ExponentialBackoff backoff(options_.backoff);

  for (;;) {
    CheckCancellation();

    if (auto piece = RaceStorageTiers(piece_index)) {
      FARMER_LOG_TRACE("Got piece", {UintField("piece_index", piece_index)});
      return piece;
    }

    FARMER_LOG_WARN("Couldn't get a piece from DSN. Retrying...", {UintField("piece_index", piece_index)});

    const auto delay = backoff.NextBackoff();
    if (!delay) {
      throw farmer::util::RetryableNetworkError("Couldn't get piece " + std::to_string(piece_index) + " from DSN");
    }
    std::this_thread::sleep_for(*delay);
  }
}

} // namespace farmer::dsn
