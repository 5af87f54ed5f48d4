#include "services/web_services/api/api_json.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "mongoose.h"

#include "core/common/utils/json_utils.hpp"

namespace devinv::services::web_services::api {

namespace json = devinv::core::common::json;
namespace model = devinv::core::device::model;

namespace {

constexpr const char* kPayloadFields[] = {"name", "ip_address", "type", "location", "status"};

}  // namespace

std::string DeviceToJson(const model::Device& d) {
  return json::Object({
      {"id", json::Quote(std::to_string(d.id))},
      {"name", json::Quote(d.name)},
      {"ip_address", json::Quote(d.ip_address)},
      {"type", json::Quote(model::ToString(d.type))},
      {"location", json::Quote(d.location)},
      {"status", json::Quote(model::ToString(d.status))},
      {"created_at", json::Quote(d.created_at)},
      {"updated_at", json::Quote(d.updated_at)},
  });
}

std::string DeviceListToJson(const std::vector<model::Device>& devices) {
  std::vector<std::string> items;
  items.reserve(devices.size());
  for (const auto& d : devices) items.push_back(DeviceToJson(d));
  return json::Array(items);
}

std::string StatusReportToJson(const devinv::core::device::manager::StatusReport& r) {
  return json::Object({
      {"status", json::Quote(model::ToString(r.status))},
      {"last_checked", json::Quote(r.last_checked)},
  });
}

std::string SuccessEnvelope(const std::string& data) {
  return json::Object({{"success", json::Bool(true)}, {"data", data}});
}

std::string ErrorEnvelope(const std::string& error, const std::string& details) {
  if (details.empty()) {
    return json::Object({{"success", json::Bool(false)}, {"error", json::Quote(error)}});
  }
  return json::Object({
      {"success", json::Bool(false)},
      {"error", json::Quote(error)},
      {"details", json::Quote(details)},
  });
}

std::string ErrorEnvelope(const devinv::core::common::error::Status& st) {
  return ErrorEnvelope(st.message, st.details);
}

devinv::core::device::validation::DevicePayload ParseDevicePayload(const std::string& body) {
  devinv::core::device::validation::DevicePayload out;
  if (body.empty()) return out;

  const struct mg_str doc = mg_str_n(body.data(), body.size());
  int toklen = 0;
  const int root = mg_json_get(doc, "$", &toklen);
  if (root < 0 || toklen <= 0 || body[static_cast<std::size_t>(root)] != '{') return out;

  for (const char* key : kPayloadFields) {
    const std::string path = std::string("$.") + key;
    int len = 0;
    const int off = mg_json_get(doc, path.c_str(), &len);
    if (off < 0 || len <= 0) continue;

    const std::string_view tok(body.data() + off, static_cast<std::size_t>(len));
    if (tok == "null") continue;

    devinv::core::device::validation::PayloadField field;
    if (tok.front() == '"') {
      char* s = mg_json_get_str(doc, path.c_str());
      if (s == nullptr) continue;
      field.text = s;
      mg_free(s);
    } else {
      field.text = std::string(tok);
      field.is_string = false;
    }
    out[key] = std::move(field);
  }
  return out;
}

}  // namespace devinv::services::web_services::api
