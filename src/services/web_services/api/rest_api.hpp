#pragma once

#include <memory>
#include <string>

#include "core/common/error/status.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/manager/device_service.hpp"

namespace devinv {
namespace services {
namespace web_services {
namespace api {

struct HttpRequest {
  std::string method;
  std::string uri;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  // Empty for 204.
  std::string body;
};

struct ApiContext {
  std::string base_path = "/api/v1";
  std::string service_name = "device-inventory";

  devinv::core::device::manager::DeviceService* device_service = nullptr;

  std::shared_ptr<devinv::core::common::log::Logger> logger;
};

// Routes one request. Never throws: unexpected faults become a 500 envelope.
HttpResponse HandleHttpRequest(const HttpRequest& req, const ApiContext& ctx);

// "/" and "/health", served outside the API prefix.
bool HandleSystemApi(const HttpRequest& req, const ApiContext& ctx, HttpResponse& out);

// Paths relative to the API prefix.
bool HandleDeviceApi(const HttpRequest& req, const std::string& rel_path, const ApiContext& ctx,
                     HttpResponse& out);

int HttpStatusFor(devinv::core::common::error::ErrorCode code);

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devinv
