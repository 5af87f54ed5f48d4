#include "services/web_services/api/rest_api.hpp"

#include <string>
#include <vector>

#include "mongoose.h"

#include "services/web_services/api/api_json.hpp"

namespace devinv {
namespace services {
namespace web_services {
namespace api {

using devinv::core::common::error::Status;
namespace model = devinv::core::device::model;
namespace manager = devinv::core::device::manager;

namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string UrlDecode(const std::string& s) {
  std::string out(s.size() + 1, '\0');
  const int n = mg_url_decode(s.c_str(), s.size(), &out[0], out.size(), 0);
  if (n < 0) return s;
  out.resize(static_cast<std::size_t>(n));
  return out;
}

static HttpResponse FromError(const Status& st) {
  return HttpResponse{HttpStatusFor(st.code), ErrorEnvelope(st)};
}

static HttpResponse MethodNotAllowed() {
  return HttpResponse{405, ErrorEnvelope("Method not allowed")};
}

static HttpResponse ListDevices(manager::DeviceService& svc) {
  std::vector<model::Device> devices;
  const Status st = svc.ListDevices(devices);
  if (!st.IsOk()) return FromError(st);
  return HttpResponse{200, SuccessEnvelope(DeviceListToJson(devices))};
}

static HttpResponse CreateDevice(manager::DeviceService& svc, const HttpRequest& req) {
  model::Device device;
  const Status st = svc.CreateDevice(ParseDevicePayload(req.body), device);
  if (!st.IsOk()) return FromError(st);
  return HttpResponse{201, SuccessEnvelope(DeviceToJson(device))};
}

static HttpResponse GetDevice(manager::DeviceService& svc, const std::string& id) {
  model::Device device;
  const Status st = svc.GetDevice(id, device);
  if (!st.IsOk()) return FromError(st);
  return HttpResponse{200, SuccessEnvelope(DeviceToJson(device))};
}

static HttpResponse UpdateDevice(manager::DeviceService& svc, const std::string& id,
                                 const HttpRequest& req) {
  model::Device device;
  const Status st = svc.UpdateDevice(id, ParseDevicePayload(req.body), device);
  if (!st.IsOk()) return FromError(st);
  return HttpResponse{200, SuccessEnvelope(DeviceToJson(device))};
}

static HttpResponse DeleteDevice(manager::DeviceService& svc, const std::string& id) {
  const Status st = svc.DeleteDevice(id);
  if (!st.IsOk()) return FromError(st);
  return HttpResponse{204, std::string()};
}

static HttpResponse CheckStatus(manager::DeviceService& svc, const std::string& id) {
  manager::StatusReport report;
  const Status st = svc.CheckStatus(id, report);
  if (!st.IsOk()) return FromError(st);
  return HttpResponse{200, SuccessEnvelope(StatusReportToJson(report))};
}

}  // namespace

bool HandleDeviceApi(const HttpRequest& req, const std::string& rel_path, const ApiContext& ctx,
                     HttpResponse& out) {
  const std::string base = "/devices";
  if (rel_path != base && !StartsWith(rel_path, base + "/")) return false;

  if (ctx.device_service == nullptr) {
    out = HttpResponse{500, ErrorEnvelope("device service not configured")};
    return true;
  }
  auto& svc = *ctx.device_service;
  const bool is_get = req.method == "GET";

  if (rel_path == base) {
    if (is_get) out = ListDevices(svc);
    else if (req.method == "POST") out = CreateDevice(svc, req);
    else out = MethodNotAllowed();
    return true;
  }

  const std::string tail = "/status";
  std::string id = rel_path.substr(base.size() + 1);
  const bool status_route = EndsWith(id, tail) && id.size() > tail.size();
  if (status_route) id = id.substr(0, id.size() - tail.size());

  if (id.empty() || id.find('/') != std::string::npos) return false;
  id = UrlDecode(id);

  if (status_route) {
    out = is_get ? CheckStatus(svc, id) : MethodNotAllowed();
    return true;
  }

  if (is_get) out = GetDevice(svc, id);
  else if (req.method == "PUT") out = UpdateDevice(svc, id, req);
  else if (req.method == "DELETE") out = DeleteDevice(svc, id);
  else out = MethodNotAllowed();
  return true;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devinv
