#include "services/web_services/api/rest_api.hpp"

#include <exception>
#include <string>

#include "core/common/utils/json_utils.hpp"
#include "services/web_services/api/api_json.hpp"

namespace devinv {
namespace services {
namespace web_services {
namespace api {

using devinv::core::common::error::ErrorCode;
namespace json = devinv::core::common::json;

namespace {

static std::string StripQuery(const std::string& uri) {
  const auto pos = uri.find('?');
  if (pos == std::string::npos) return uri;
  return uri.substr(0, pos);
}

static bool StripBasePath(const std::string& uri, const std::string& base_path, std::string& out_rel) {
  if (base_path.empty() || base_path == "/") {
    out_rel = uri;
    return true;
  }
  if (uri == base_path) {
    out_rel = "/";
    return true;
  }
  const std::string prefix = base_path + "/";
  if (uri.size() >= prefix.size() && uri.compare(0, prefix.size(), prefix) == 0) {
    out_rel = uri.substr(base_path.size());
    if (out_rel.empty()) out_rel = "/";
    return true;
  }
  return false;
}

static HttpResponse NotFoundRoute() {
  return HttpResponse{404, ErrorEnvelope("Not found")};
}

static HttpResponse InternalError(const std::string& what) {
  return HttpResponse{500, ErrorEnvelope(what)};
}

}  // namespace

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok: return 200;
    case ErrorCode::Validation: return 400;
    case ErrorCode::NotFound: return 404;
    case ErrorCode::DuplicateKey:
    case ErrorCode::Conflict: return 409;
    case ErrorCode::Unavailable: return 503;
    case ErrorCode::StorageFailure:
    case ErrorCode::Internal: return 500;
  }
  return 500;
}

HttpResponse HandleHttpRequest(const HttpRequest& req, const ApiContext& ctx) {
  try {
    const auto& log = ctx.logger;
    if (log) log->Debug("HTTP " + req.method + " " + req.uri);

    HttpRequest r = req;
    r.uri = StripQuery(req.uri);

    HttpResponse out;
    if (HandleSystemApi(r, ctx, out)) return out;

    std::string rel_path;
    if (StripBasePath(r.uri, ctx.base_path, rel_path) && HandleDeviceApi(r, rel_path, ctx, out)) {
      return out;
    }
    return NotFoundRoute();
  } catch (const std::exception& e) {
    if (ctx.logger) ctx.logger->Error(std::string("unhandled error: ") + e.what());
    return InternalError(e.what());
  } catch (...) {
    if (ctx.logger) ctx.logger->Error("unhandled non-standard exception");
    return InternalError("Internal server error");
  }
}

bool HandleSystemApi(const HttpRequest& req, const ApiContext& ctx, HttpResponse& out) {
  if (req.uri != "/" && req.uri != "/health") return false;
  if (req.method != "GET") {
    out = HttpResponse{405, ErrorEnvelope("Method not allowed")};
    return true;
  }

  if (req.uri == "/") {
    out.status = 200;
    out.body = json::Object({
        {"success", json::Bool(true)},
        {"service", json::Quote(ctx.service_name)},
        {"message", json::Quote("OK")},
    });
    return true;
  }

  devinv::core::device::manager::HealthReport health;
  if (ctx.device_service != nullptr) {
    health = ctx.device_service->CheckHealth();
  } else {
    health.error = "device service not configured";
  }

  out.status = 200;
  out.body = json::Object({
      {"success", json::Bool(true)},
      {"service", json::Quote(ctx.service_name)},
      {"db_available", json::Bool(health.db_available)},
      {"error", health.db_available ? json::Null() : json::Quote(health.error)},
  });
  return true;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devinv
