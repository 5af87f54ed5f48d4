#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/common/config/config_manager.hpp"

namespace devinv::core::common::config {

struct Settings {
  std::string server_host = "0.0.0.0";
  std::uint16_t server_port = 3001;
  std::size_t server_workers = 4;
  std::string api_prefix = "/api/v1";

  // Directory holding "<store_db>.sqlite3", or ":memory:".
  std::string store_uri = "data";
  std::string store_db = "devicesdb";
  std::int64_t store_timeout_ms = 1000;

  std::int64_t probe_timeout_ms = 2000;

  std::string log_level = "info";
  std::string log_file;
};

const std::vector<ConfigManager::EnvBinding>& EnvironmentBindings();

// Overlays every recognized key of `cfg` onto `out`. Returns one message per
// invalid value; `out` keeps the default for those keys.
std::vector<std::string> ReadSettings(const ConfigManager& cfg, Settings& out);

std::string StorePath(const Settings& s);

}  // namespace devinv::core::common::config
