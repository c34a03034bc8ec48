#include "tradeledger/config/ledger_config.hpp"

#include <fstream>

namespace tradeledger {

namespace {

ClockMode parseClockMode(const std::string& mode) {
  if (mode == "live") {
    return ClockMode::Live;
  }
  if (mode == "simulation") {
    return ClockMode::Simulation;
  }
  throw ConfigError("clock.mode must be \"live\" or \"simulation\", got \"" +
                    mode + "\"");
}

}  // namespace

// -----------------------------------------------------------------------------
// fromJson(): overlay present keys on the defaults
// -----------------------------------------------------------------------------
LedgerConfig LedgerConfig::fromJson(const nlohmann::json& j) {
  LedgerConfig config;

  try {
    if (j.contains("ipc")) {
      const nlohmann::json& ipc = j.at("ipc");
      config.ipc.enabled = ipc.value("enabled", config.ipc.enabled);
      config.ipc.command_endpoint =
          ipc.value("command_endpoint", config.ipc.command_endpoint);
      config.ipc.publish_endpoint =
          ipc.value("publish_endpoint", config.ipc.publish_endpoint);
    }
    if (j.contains("clock")) {
      const nlohmann::json& clock = j.at("clock");
      config.clock.mode =
          parseClockMode(clock.value("mode", std::string("live")));
      config.clock.start_ms = clock.value("start_ms", config.clock.start_ms);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }

  if (config.ipc.enabled && (config.ipc.command_endpoint.empty() ||
                             config.ipc.publish_endpoint.empty())) {
    throw ConfigError("ipc is enabled but an endpoint is empty");
  }

  return config;
}

// -----------------------------------------------------------------------------
// loadLedgerConfig(): read file, parse, validate
// -----------------------------------------------------------------------------
LedgerConfig loadLedgerConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("malformed config file " + path + ": " + e.what());
  }

  return LedgerConfig::fromJson(j);
}

}  // namespace tradeledger
