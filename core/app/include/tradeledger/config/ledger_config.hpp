#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tradeledger {

enum class ClockMode {
  Live,        // LiveTimeProvider (system clock)
  Simulation,  // SimulationTimeProvider starting at start_ms
};

struct IpcConfig {
  bool enabled{true};
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
};

struct ClockConfig {
  ClockMode mode{ClockMode::Live};
  std::int64_t start_ms{0};
};

// -----------------------------------------------------------------------------
// LedgerConfig
// -----------------------------------------------------------------------------
//
// @brief  Process-level settings of the ledger executable.
//
// @details
// JSON layout (every key optional, defaults as in the member initializers):
//
//   {
//     "ipc":   { "enabled": true,
//                "command_endpoint": "tcp://127.0.0.1:5556",
//                "publish_endpoint": "tcp://127.0.0.1:5557" },
//     "clock": { "mode": "live" | "simulation", "start_ms": 0 }
//   }
//
// Enabling IPC with an empty endpoint, or an unknown clock mode, is
// rejected with ConfigError rather than silently defaulted.
// -----------------------------------------------------------------------------
struct LedgerConfig {
  IpcConfig ipc;
  ClockConfig clock;

  // @throws ConfigError on a wrongly typed or invalid value.
  static LedgerConfig fromJson(const nlohmann::json& j);
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Reads and parses a config file.
// @throws ConfigError if the file cannot be opened, is not valid JSON, or
//         fails LedgerConfig::fromJson.
LedgerConfig loadLedgerConfig(const std::string& path);

}  // namespace tradeledger
