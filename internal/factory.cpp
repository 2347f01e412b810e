#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace farmer::factory {

using namespace farmer;

namespace {

constexpr uint32_t kDefaultRecordSize                = 32768;
constexpr uint32_t kDefaultSpaceL                    = 20;
constexpr uint32_t kDefaultRecordedHistorySegmentSize = 32768 * 128;
constexpr const char* kDefaultPiecesPath             = "pieces";
constexpr const char* kDefaultOutputPath             = "plots";

template <typename T>
T OrDefault(T value, T fallback) {
  return value == 0 ? fallback : value;
}

} // namespace

dsn::RetrievalOptions ToRetrievalOptions(const farmer::runtime::config::RetrievalConfig& config) {
  dsn::RetrievalOptions options;

  if (config.archival_storage_delay_ms() != 0) {
    options.archival_storage_delay = std::chrono::milliseconds(config.archival_storage_delay_ms());
  }
  if (config.lookup_timeout_ms() != 0) {
    options.lookup_timeout = std::chrono::milliseconds(config.lookup_timeout_ms());
  }
  if (config.initial_interval_ms() != 0) {
    options.backoff.initial_interval = std::chrono::milliseconds(config.initial_interval_ms());
  }
  if (config.max_interval_ms() != 0) {
    options.backoff.max_interval = std::chrono::milliseconds(config.max_interval_ms());
  }
  if (config.max_elapsed_ms() != 0) {
    options.backoff.max_elapsed_time = std::chrono::milliseconds(config.max_elapsed_ms());
  }

  if (options.backoff.max_interval < options.backoff.initial_interval) {
    throw std::invalid_argument("retrieval.max_interval_ms must not be below retrieval.initial_interval_ms");
  }

  return options;
}

plotting::PlottingOptions ToPlottingOptions(const farmer::runtime::config::PlottingConfig& config) {
  plotting::PlottingOptions options;
  options.replication_factor = OrDefault<uint64_t>(config.replication_factor(), options.replication_factor);
  return options;
}

model::FarmerProtocolInfo ToProtocolInfo(const farmer::runtime::config::ProtocolConfig& config) {
  if (config.space_l() > 64) {
    throw std::invalid_argument("protocol.space_l must be in 1..64, got " + std::to_string(config.space_l()));
  }

  model::FarmerProtocolInfo info;
  info.record_size                   = OrDefault<uint32_t>(config.record_size(), kDefaultRecordSize);
  info.space_l                       = static_cast<uint16_t>(OrDefault<uint32_t>(config.space_l(), kDefaultSpaceL));
  info.recorded_history_segment_size = OrDefault<uint32_t>(config.recorded_history_segment_size(), kDefaultRecordedHistorySegmentSize);
  info.total_pieces                  = config.total_pieces();
  info.sector_expiration             = config.sector_expiration();

  model::Validate(info);
  return info;
}

/*
    Build full application dependency graph
*/
Application Build(const farmer::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Protocol parameters
  // ------------------------------------------------------------------
  app.protocol_info = ToProtocolInfo(config.protocol());

  // ------------------------------------------------------------------
  // Compute
  // ------------------------------------------------------------------
  app.pool    = std::make_shared<util::WorkerPool>(config.plotting().worker_threads());
  app.plotter = std::make_shared<plotting::Plotter>(app.pool, ToPlottingOptions(config.plotting()));

  // ------------------------------------------------------------------
  // Piece source and output
  // ------------------------------------------------------------------
  const std::string pieces_path = config.plotting().pieces_path().empty() ? kDefaultPiecesPath : config.plotting().pieces_path();
  const std::string output_path = config.plotting().output_path().empty() ? kDefaultOutputPath : config.plotting().output_path();

  app.piece_store = std::make_shared<storage::DiskPieceStore>(pieces_path);
  app.output_path = output_path;
  std::filesystem::create_directories(app.output_path);

  FARMER_LOG_DEBUG("Farmer components built", {observability::UintField("worker_threads", app.pool->Size()),
                                               observability::StringField("pieces_path", pieces_path),
                                               observability::StringField("output_path", output_path),
                                               observability::UintField("pieces_in_sector", model::PiecesInSector(app.protocol_info))});

  return app;
}

} // namespace farmer::factory
