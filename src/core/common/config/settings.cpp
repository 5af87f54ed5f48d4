#include "core/common/config/settings.hpp"

#include <string>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/network_utils.hpp"

namespace devinv::core::common::config {

namespace {

std::string InvalidValueMessage(const ConfigManager& cfg, const std::string& key,
                                const char* expected) {
  std::string msg = "invalid config value " + key + "=\"" + cfg.GetStringOr(key, "") +
                    "\": expected " + expected;
  const std::string origin = cfg.Origin(key);
  if (!origin.empty()) msg += " (from " + origin + ")";
  return msg;
}

void ReadPositive(const ConfigManager& cfg, const std::string& key, std::int64_t max,
                  std::int64_t& out, std::vector<std::string>& errors) {
  if (!cfg.Has(key)) return;
  std::int64_t v = 0;
  if (!cfg.GetInt64(key, v) || v <= 0 || v > max) {
    errors.push_back(InvalidValueMessage(cfg, key, "a positive integer in range"));
    return;
  }
  out = v;
}

std::string NormalizePrefix(std::string p) {
  if (p.empty()) return p;
  if (p[0] != '/') p.insert(p.begin(), '/');
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  if (p == "/") return std::string();
  return p;
}

}  // namespace

const std::vector<ConfigManager::EnvBinding>& EnvironmentBindings() {
  static const std::vector<ConfigManager::EnvBinding> kBindings = {
      {"SERVER_HOST", "server.host"},
      {"SERVER_PORT", "server.port"},
      {"SERVER_WORKERS", "server.workers"},
      {"API_PREFIX", "api.prefix"},
      {"STORE_URI", "store.uri"},
      {"STORE_DB", "store.db"},
      {"STORE_TIMEOUT_MS", "store.timeout_ms"},
      {"PROBE_TIMEOUT_MS", "probe.timeout_ms"},
      {"LOG_LEVEL", "log.level"},
      {"LOG_FILE", "log.file"},
  };
  return kBindings;
}

std::vector<std::string> ReadSettings(const ConfigManager& cfg, Settings& out) {
  std::vector<std::string> errors;

  std::string s;
  if (cfg.GetString("server.host", s)) {
    if (s.empty()) {
      errors.push_back(InvalidValueMessage(cfg, "server.host", "a host name or address"));
    } else {
      out.server_host = s;
    }
  }

  if (cfg.Has("server.port")) {
    std::int64_t port = 0;
    if (cfg.GetInt64("server.port", port) && net::IsValidPort(port)) {
      out.server_port = static_cast<std::uint16_t>(port);
    } else {
      errors.push_back(InvalidValueMessage(cfg, "server.port", "a port in 1..65535"));
    }
  }

  std::int64_t workers = static_cast<std::int64_t>(out.server_workers);
  ReadPositive(cfg, "server.workers", 256, workers, errors);
  out.server_workers = static_cast<std::size_t>(workers);

  if (cfg.GetString("api.prefix", s)) out.api_prefix = NormalizePrefix(s);
  else out.api_prefix = NormalizePrefix(out.api_prefix);

  if (cfg.GetString("store.uri", s)) {
    if (s.empty()) {
      errors.push_back(InvalidValueMessage(cfg, "store.uri", "a directory or :memory:"));
    } else {
      out.store_uri = s;
    }
  }
  if (cfg.GetString("store.db", s)) {
    if (s.empty() || s.find('/') != std::string::npos) {
      errors.push_back(InvalidValueMessage(cfg, "store.db", "a plain database name"));
    } else {
      out.store_db = s;
    }
  }

  ReadPositive(cfg, "store.timeout_ms", 60'000, out.store_timeout_ms, errors);
  ReadPositive(cfg, "probe.timeout_ms", 60'000, out.probe_timeout_ms, errors);

  if (cfg.GetString("log.level", s)) {
    if (log::ParseLevel(s).has_value()) {
      out.log_level = s;
    } else {
      errors.push_back(InvalidValueMessage(cfg, "log.level", "trace|debug|info|warn|error|fatal"));
    }
  }
  if (cfg.GetString("log.file", s)) out.log_file = s;

  return errors;
}

std::string StorePath(const Settings& s) {
  if (s.store_uri == ":memory:") return s.store_uri;
  std::string dir = s.store_uri;
  while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
  return dir + "/" + s.store_db + ".sqlite3";
}

}  // namespace devinv::core::common::config
