#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"

#include "internal/dsn/piece_provider.hpp"
#include "internal/model/piece.hpp"
#include "internal/plotting/plotting.hpp"
#include "internal/storage/disk_piece_store.hpp"
#include "internal/util/worker_pool.hpp"

namespace farmer::factory {

/*
  Application

  Owns all long-lived objects used by the farmer.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<util::WorkerPool>        pool;
  std::shared_ptr<plotting::Plotter>       plotter;
  std::shared_ptr<storage::DiskPieceStore> piece_store;

  model::FarmerProtocolInfo protocol_info;
  std::filesystem::path     output_path;
};

// Config sections with zero values resolve to built-in defaults.
dsn::RetrievalOptions     ToRetrievalOptions(const farmer::runtime::config::RetrievalConfig& config);
plotting::PlottingOptions ToPlottingOptions(const farmer::runtime::config::PlottingConfig& config);

// Throws std::invalid_argument when the resulting parameters are unusable.
model::FarmerProtocolInfo ToProtocolInfo(const farmer::runtime::config::ProtocolConfig& config);

/*
  Build

  Constructs the whole farmer based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to pick concrete piece sources.
*/
Application Build(const farmer::runtime::config::RuntimeConfig& config);

} // namespace farmer::factory
