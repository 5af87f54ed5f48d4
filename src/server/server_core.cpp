#include "server/server_core.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include "core/common/config/config_manager.hpp"
#include "core/common/config/settings.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/device_service.hpp"
#include "core/device/probe/icmp_probe.hpp"
#include "core/device/storage/sqlite_device_repository.hpp"
#include "core/device/storage/sqlite_store.hpp"
#include "services/web_services/api/rest_api.hpp"
#include "services/web_services/http/http_server.hpp"

namespace devinv {
namespace server {

namespace config = devinv::core::common::config;
namespace log = devinv::core::common::log;
namespace storage = devinv::core::device::storage;

namespace {

std::atomic<bool> g_running{true};

void HandleSignal(int) {
  g_running.store(false);
}

void ApplyArgs(const Args& a, config::ConfigManager& cfg) {
  if (!a.host.empty()) cfg.Set("server.host", a.host);
  if (!a.port.empty()) cfg.Set("server.port", a.port);
  if (!a.store_uri.empty()) cfg.Set("store.uri", a.store_uri);
  if (!a.log_level.empty()) cfg.Set("log.level", a.log_level);
  if (!a.log_file.empty()) cfg.Set("log.file", a.log_file);
}

std::shared_ptr<log::Logger> MakeLogger(const config::Settings& s) {
  std::shared_ptr<log::Sink> sink;
  if (s.log_file.empty()) {
    sink = std::make_shared<log::ConsoleSink>();
  } else {
    const std::filesystem::path file(s.log_file);
    if (file.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(file.parent_path(), ec);
      if (ec) std::cerr << "cannot create log directory: " << ec.message() << "\n";
    }
    auto file_sink = std::make_shared<log::FileSink>(file);
    if (file_sink->IsOpen()) {
      sink = file_sink;
    } else {
      std::cerr << "cannot open log file " << s.log_file << ", logging to stdout\n";
      sink = std::make_shared<log::ConsoleSink>();
    }
  }

  auto logger = std::make_shared<log::Logger>(sink);
  if (const auto lvl = log::ParseLevel(s.log_level); lvl.has_value()) {
    logger->SetLevel(*lvl);
  }
  return logger;
}

}  // namespace

int ServerCore::Run(const Args& args) {
  g_running.store(true);
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  config::ConfigManager cfg;
  if (!args.config_yaml.empty() && !cfg.LoadYamlFile(args.config_yaml)) {
    std::cerr << "failed to load config " << args.config_yaml << ": " << cfg.LastError() << "\n";
    return 2;
  }
  cfg.MergeEnvironment(config::EnvironmentBindings());
  ApplyArgs(args, cfg);

  config::Settings settings;
  const auto errors = config::ReadSettings(cfg, settings);
  if (!errors.empty()) {
    for (const auto& e : errors) std::cerr << e << "\n";
    return 2;
  }

  auto logger = MakeLogger(settings);
  logger->Info("device inventory starting");

  if (settings.store_uri != ":memory:") {
    std::error_code ec;
    std::filesystem::create_directories(settings.store_uri, ec);
    if (ec) logger->Warn("cannot create store directory " + settings.store_uri + ": " + ec.message());
  }

  storage::SqliteStore::Options store_opt;
  store_opt.path = config::StorePath(settings);
  store_opt.busy_timeout = std::chrono::milliseconds(settings.store_timeout_ms);
  auto store = std::make_shared<storage::SqliteStore>(store_opt, logger);
  auto repository = std::make_shared<storage::SqliteDeviceRepository>(store, logger);

  const auto opened = store->Open();
  if (opened.IsOk()) {
    logger->Info("store available, schema ensured: " + store_opt.path);
  } else {
    logger->Warn("store unavailable at startup: " + opened.details + ". Continuing without store.");
  }

  auto probe = std::make_shared<devinv::core::device::probe::IcmpProbe>(logger);

  devinv::core::device::manager::DeviceService::Options svc_opt;
  svc_opt.probe_timeout = std::chrono::milliseconds(settings.probe_timeout_ms);
  devinv::core::device::manager::DeviceService service(repository, probe, svc_opt, logger);

  devinv::services::web_services::api::ApiContext ctx;
  ctx.base_path = settings.api_prefix;
  ctx.device_service = &service;
  ctx.logger = logger;

  devinv::services::web_services::http::MongooseServer::Options web_opt;
  web_opt.listen_addr =
      "http://" + devinv::core::common::net::JoinHostPort(settings.server_host, settings.server_port);
  web_opt.workers = settings.server_workers;

  int rc = 0;
  {
    devinv::services::web_services::http::MongooseServer web_server(
        web_opt,
        [&ctx](const devinv::services::web_services::api::HttpRequest& req) {
          return devinv::services::web_services::api::HandleHttpRequest(req, ctx);
        },
        logger);

    if (!web_server.Start()) {
      logger->Error("failed to start HTTP server on " + web_opt.listen_addr);
      rc = 1;
    } else {
      logger->Info("API prefix " + (settings.api_prefix.empty() ? "/" : settings.api_prefix));

      std::int64_t last_heartbeat_ms = 0;
      while (g_running.load()) {
        web_server.Poll(100);

        const auto now = devinv::core::common::time::NowUnixMs();
        if (last_heartbeat_ms == 0 || now - last_heartbeat_ms >= 10'000) {
          last_heartbeat_ms = now;
          logger->Debug("heartbeat");
          logger->Flush();
        }
      }
      web_server.Stop();
    }
  }

  store->Close();
  logger->Info("device inventory stopping");
  logger->Flush();
  return rc;
}

}  // namespace server
}  // namespace devinv
