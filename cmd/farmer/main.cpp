#include <arrow/io/file.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/piece.hpp"
#include "internal/observability/logging.hpp"
#include "internal/plotting/plotting.hpp"
#include "internal/pot/proof_of_time.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/hex.hpp"

using farmer::observability::StringField;
using farmer::observability::UintField;

static std::atomic<bool> g_shutting_down{false};

void HandleSignal(int) {
  g_shutting_down.store(true, std::memory_order_release);
}

namespace {

void PrintUsage() {
  std::cerr << "Usage:\n"
            << "  farmer plot --config <config.yaml> --public-key <hex> --sector-index <n>\n"
            << "  farmer pot-prove --seed <hex> --iterations <n> [--config <config.yaml>]\n"
            << "  farmer pot-verify --seed <hex> --iterations <n> --checkpoints <hex,...> [--config <config.yaml>]" << std::endl;
}

// --flag value pairs after the subcommand.
std::map<std::string, std::string> ParseFlags(int argc, char** argv) {
  std::map<std::string, std::string> flags;
  for (int i = 2; i < argc; i += 2) {
    const std::string flag = argv[i];
    if (flag.rfind("--", 0) != 0 || i + 1 >= argc) {
      throw std::invalid_argument("malformed argument: " + flag);
    }
    flags[flag.substr(2)] = argv[i + 1];
  }
  return flags;
}

const std::string& Require(const std::map<std::string, std::string>& flags, const std::string& name) {
  auto it = flags.find(name);
  if (it == flags.end()) throw std::invalid_argument("missing --" + name);
  return it->second;
}

uint64_t ParseUint(const std::string& value, const std::string& name) {
  std::size_t consumed = 0;
  const auto  parsed   = std::stoull(value, &consumed);
  if (consumed != value.size()) throw std::invalid_argument("--" + name + " must be an unsigned integer");
  return parsed;
}

uint32_t ParseIterations(const std::map<std::string, std::string>& flags) {
  const auto iterations = ParseUint(Require(flags, "iterations"), "iterations");
  if (iterations > UINT32_MAX) throw std::invalid_argument("--iterations does not fit in 32 bits");
  return static_cast<uint32_t>(iterations);
}

farmer::runtime::config::RuntimeConfig LoadConfig(const std::map<std::string, std::string>& flags) {
  auto it = flags.find("config");
  if (it == flags.end()) return farmer::runtime::config::RuntimeConfig{};
  return farmer::config::ConfigLoader::LoadFromYaml(it->second);
}

int RunPlot(const std::map<std::string, std::string>& flags, const farmer::runtime::config::RuntimeConfig& config) {
  using namespace farmer::storage::common;

  Require(flags, "config");
  const auto public_key   = farmer::util::FromHexFixed<32>(Require(flags, "public-key"));
  const auto sector_index = ParseUint(Require(flags, "sector-index"), "sector-index");

  // ------------------------------------------------------------
  // Build application (dependency graph)
  // ------------------------------------------------------------
  auto app = farmer::factory::Build(config);

  const auto sector_path   = SectorPath(app.output_path, sector_index);
  const auto metadata_path = SectorMetadataPath(app.output_path, sector_index);

  auto sector   = Unwrap(arrow::io::FileOutputStream::Open(sector_path.string()));
  auto metadata = Unwrap(arrow::io::FileOutputStream::Open(metadata_path.string()));

  FARMER_LOG_INFO("Plotting sector", {UintField("sector_index", sector_index), StringField("sector_path", sector_path.string())});

  const auto status = app.plotter->PlotSector(public_key, sector_index, *app.piece_store, g_shutting_down, app.protocol_info, *sector, *metadata);

  Unwrap(sector->Close());
  Unwrap(metadata->Close());

  if (status == farmer::plotting::PlottingStatus::kInterrupted) {
    FARMER_LOG_WARN("Plotting interrupted, sector is incomplete", {UintField("sector_index", sector_index)});
    return 3;
  }

  FARMER_LOG_INFO("Sector plotted", {UintField("sector_index", sector_index)});
  return 0;
}

int RunPotProve(const std::map<std::string, std::string>& flags) {
  const auto seed        = farmer::util::FromHexFixed<16>(Require(flags, "seed"));
  const auto checkpoints = farmer::pot::Prove(seed, ParseIterations(flags));

  for (const auto& checkpoint : checkpoints) {
    std::cout << farmer::util::ToHex(checkpoint) << "\n";
  }
  return 0;
}

int RunPotVerify(const std::map<std::string, std::string>& flags) {
  const auto seed       = farmer::util::FromHexFixed<16>(Require(flags, "seed"));
  const auto iterations = ParseIterations(flags);

  std::vector<farmer::pot::PotOutput> checkpoints;
  std::stringstream                   list(Require(flags, "checkpoints"));
  std::string                         item;
  while (std::getline(list, item, ',')) {
    if (!item.empty()) checkpoints.push_back(farmer::util::FromHexFixed<16>(item));
  }

  const bool valid = farmer::pot::Verify(seed, iterations, checkpoints);
  std::cout << (valid ? "valid" : "invalid") << std::endl;
  return valid ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }

  const std::string command = argv[1];

  try {
    const auto flags = ParseFlags(argc, argv);

    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    const auto config = LoadConfig(flags);
    farmer::observability::InitializeLogging(config);

    // Register signal handlers before any long-running work.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int rc = 1;
    if (command == "plot") {
      rc = RunPlot(flags, config);
    } else if (command == "pot-prove") {
      rc = RunPotProve(flags);
    } else if (command == "pot-verify") {
      rc = RunPotVerify(flags);
    } else {
      PrintUsage();
    }

    farmer::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    FARMER_LOG_ERROR("Fatal error", {StringField("command", command), StringField("error", e.what())});
    farmer::observability::ShutdownLogging();
    return 2;
  }
}
