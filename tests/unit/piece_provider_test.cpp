#include "internal/dsn/piece_provider.hpp"

#include <arrow/buffer.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using farmer::dsn::ContentKey;
using farmer::dsn::DsnNode;
using farmer::dsn::PeerId;
using farmer::dsn::PieceKey;
using farmer::dsn::PieceProvider;
using farmer::dsn::PieceValidator;
using farmer::dsn::ProviderStream;
using farmer::dsn::RetrievalOptions;
using farmer::model::Piece;
using farmer::model::PieceIndex;
using farmer::model::StorageType;
using std::chrono::milliseconds;

// How one storage tier of the fake network answers.
struct TierBehavior {
  milliseconds         response_delay{0};
  std::optional<Piece> piece;
  bool                 fail_lookup  = false;
  bool                 fail_request = false;
};

class SinglePeerStream final : public ProviderStream {
 public:
  explicit SinglePeerStream(PeerId peer) : peer_(std::move(peer)) {
  }

  std::optional<PeerId> Next() override {
    if (done_) return std::nullopt;
    done_ = true;
    return peer_;
  }

 private:
  PeerId peer_;
  bool   done_ = false;
};

class FakeNode final : public DsnNode {
 public:
  FakeNode(TierBehavior cache, TierBehavior archival) : cache_(std::move(cache)), archival_(std::move(archival)) {
  }

  std::unique_ptr<ProviderStream> GetProviders(const ContentKey& key) override {
    // First byte of the multihash code tells the tiers apart.
    const bool cache = key.at(0) == 0x90;
    (cache ? cache_lookups_ : archival_lookups_).fetch_add(1);

    if ((cache ? cache_ : archival_).fail_lookup) throw std::runtime_error("provider lookup failed");
    return std::make_unique<SinglePeerStream>(cache ? "peer-cache" : "peer-archival");
  }

  std::optional<Piece> SendPieceByHashRequest(const PeerId&, const PieceKey& key) override {
    const auto& tier = key.storage_type == StorageType::kCache ? cache_ : archival_;
    std::this_thread::sleep_for(tier.response_delay);
    if (tier.fail_request) throw std::runtime_error("request failed");
    return tier.piece;
  }

  int CacheLookups() const {
    return cache_lookups_.load();
  }

  int ArchivalLookups() const {
    return archival_lookups_.load();
  }

 private:
  TierBehavior     cache_;
  TierBehavior     archival_;
  std::atomic<int> cache_lookups_{0};
  std::atomic<int> archival_lookups_{0};
};

class RejectingValidator final : public PieceValidator {
 public:
  std::optional<Piece> ValidatePiece(const PeerId&, PieceIndex, Piece) override {
    calls.fetch_add(1);
    return std::nullopt;
  }

  std::atomic<int> calls{0};
};

Piece MakePiece(const std::string& content) {
  return arrow::Buffer::FromString(content);
}

bool SameBytes(const Piece& piece, const std::string& content) {
  return piece && piece->ToString() == content;
}

void TestCacheWinsWithoutWaitingForArchival() {
  auto node = std::make_shared<FakeNode>(TierBehavior{milliseconds(500), MakePiece("from-cache")},
                                         TierBehavior{milliseconds(3000), MakePiece("from-archival")});
  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, nullptr, cancelled);

  const auto started = farmer::util::Now();
  const auto piece   = provider.GetPiece(7);
  const auto elapsed = farmer::util::ElapsedMillis(started);

  assert(piece.has_value());
  assert(SameBytes(*piece, "from-cache"));
  assert(elapsed >= 450);
  assert(elapsed < 2000);
  assert(node->CacheLookups() == 1);
}

void TestArchivalAnswersWhenCacheIsEmpty() {
  auto node = std::make_shared<FakeNode>(TierBehavior{}, TierBehavior{milliseconds(0), MakePiece("from-archival")});

  RetrievalOptions options;
  options.archival_storage_delay = milliseconds(100);

  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, nullptr, cancelled, options);

  const auto started = farmer::util::Now();
  const auto piece   = provider.GetPiece(1);
  const auto elapsed = farmer::util::ElapsedMillis(started);

  assert(piece.has_value());
  assert(SameBytes(*piece, "from-archival"));
  assert(elapsed >= 90);
  assert(elapsed < 1000);
  assert(node->ArchivalLookups() == 1);
}

void TestFailingNetworkRetriesUntilCancelled() {
  TierBehavior failing;
  failing.fail_lookup = true;
  auto node           = std::make_shared<FakeNode>(failing, failing);

  RetrievalOptions options;
  options.archival_storage_delay       = milliseconds(50);
  options.backoff.randomization_factor = 0;

  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, nullptr, cancelled, options);

  auto result = std::async(std::launch::async, [&] { return provider.GetPiece(3); });

  // Attempts start at ~0s, ~1.05s and ~2.6s.
  std::this_thread::sleep_for(milliseconds(3000));
  assert(node->CacheLookups() >= 3);
  assert(node->ArchivalLookups() >= 2);

  cancelled.store(true, std::memory_order_release);
  const auto cancelled_at = farmer::util::Now();

  // The next check happens after the current backoff of at most 2.25s.
  assert(result.wait_for(milliseconds(4000)) == std::future_status::ready);
  assert(farmer::util::ElapsedMillis(cancelled_at) < 3000);

  bool threw = false;
  try {
    (void)result.get();
  } catch (const farmer::util::Cancelled&) {
    threw = true;
  }
  assert(threw && "cancellation must surface as Cancelled");
}

void TestCancelledBeforeStartDoesNotTouchNetwork() {
  auto              node = std::make_shared<FakeNode>(TierBehavior{}, TierBehavior{});
  std::atomic<bool> cancelled{true};
  PieceProvider     provider(node, nullptr, cancelled);

  bool threw = false;
  try {
    (void)provider.GetPiece(0);
  } catch (const farmer::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(node->CacheLookups() == 0);
}

void TestValidatorRejectionIsRetriedThenGivesUp() {
  auto node      = std::make_shared<FakeNode>(TierBehavior{milliseconds(0), MakePiece("bad")}, TierBehavior{milliseconds(0), MakePiece("bad")});
  auto validator = std::make_shared<RejectingValidator>();

  RetrievalOptions options;
  options.archival_storage_delay   = milliseconds(10);
  options.backoff.initial_interval = milliseconds(20);
  options.backoff.max_elapsed_time = milliseconds(200);

  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, validator, cancelled, options);

  bool threw = false;
  try {
    (void)provider.GetPiece(11);
  } catch (const farmer::util::RetryableNetworkError&) {
    threw = true;
  }
  assert(threw && "exhausted retries must surface as a retryable network error");
  assert(validator->calls.load() >= 2);
}

void TestFailedRequestsFallBackToOtherTier() {
  TierBehavior broken_cache;
  broken_cache.fail_request = true;
  broken_cache.piece        = MakePiece("never");

  auto node = std::make_shared<FakeNode>(broken_cache, TierBehavior{milliseconds(0), MakePiece("from-archival")});

  RetrievalOptions options;
  options.archival_storage_delay = milliseconds(20);

  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, nullptr, cancelled, options);

  const auto piece = provider.GetPiece(5);
  assert(piece.has_value());
  assert(SameBytes(*piece, "from-archival"));
}

void TestHungLookupsTimeOutAndRetry() {
  // Both tiers take far longer to answer than the lookup timeout allows.
  TierBehavior hung;
  hung.response_delay = milliseconds(5000);
  auto node           = std::make_shared<FakeNode>(hung, hung);

  RetrievalOptions options;
  options.archival_storage_delay       = milliseconds(50);
  options.lookup_timeout               = milliseconds(300);
  options.backoff.initial_interval     = milliseconds(100);
  options.backoff.randomization_factor = 0;

  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, nullptr, cancelled, options);

  auto result = std::async(std::launch::async, [&] { return provider.GetPiece(13); });

  // The first race gives up at ~300ms; the second starts at ~400ms.
  std::this_thread::sleep_for(milliseconds(700));
  assert(node->CacheLookups() >= 2);
  assert(node->ArchivalLookups() >= 2);
  assert(result.wait_for(milliseconds(0)) == std::future_status::timeout);

  cancelled.store(true, std::memory_order_release);
  assert(result.wait_for(milliseconds(1500)) == std::future_status::ready);

  bool threw = false;
  try {
    (void)result.get();
  } catch (const farmer::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

void TestHungCacheLosesToArchival() {
  auto node = std::make_shared<FakeNode>(TierBehavior{milliseconds(5000), MakePiece("from-cache")},
                                         TierBehavior{milliseconds(0), MakePiece("from-archival")});

  RetrievalOptions options;
  options.archival_storage_delay = milliseconds(50);
  options.lookup_timeout         = milliseconds(1000);

  std::atomic<bool> cancelled{false};
  PieceProvider     provider(node, nullptr, cancelled, options);

  const auto started = farmer::util::Now();
  const auto piece   = provider.GetPiece(21);
  const auto elapsed = farmer::util::ElapsedMillis(started);

  assert(piece.has_value());
  assert(SameBytes(*piece, "from-archival"));
  assert(elapsed < 1000);
  assert(node->CacheLookups() == 1);
}

} // namespace

int main() {
  TestCacheWinsWithoutWaitingForArchival();
  TestArchivalAnswersWhenCacheIsEmpty();
  TestFailingNetworkRetriesUntilCancelled();
  TestCancelledBeforeStartDoesNotTouchNetwork();
  TestValidatorRejectionIsRetriedThenGivesUp();
  TestFailedRequestsFallBackToOtherTier();
  TestHungLookupsTimeOutAndRetry();
  TestHungCacheLosesToArchival();

  std::cout << "farmer_unit_piece_provider: pass\n";
  return 0;
}
