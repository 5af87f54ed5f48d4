#include "core/device/validation/device_validator.hpp"

#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/network_utils.hpp"

namespace devinv {
namespace core {
namespace device {
namespace validation {

namespace {

const std::vector<std::string>& BaseRequiredFields() {
  static const std::vector<std::string> kFields = {"name", "ip_address", "type", "location"};
  return kFields;
}

const PayloadField* Find(const DevicePayload& payload, const std::string& key) {
  const auto it = payload.find(key);
  if (it == payload.end()) return nullptr;
  return &it->second;
}

std::optional<ValidationError> CheckRequired(const DevicePayload& payload,
                                             const std::string& key) {
  const PayloadField* f = Find(payload, key);
  if (f == nullptr) return ValidationError{key, "field required"};
  if (!f->is_string) return ValidationError{key, "must be a string"};
  if (f->text.empty()) return ValidationError{key, "must not be empty"};
  return std::nullopt;
}

}  // namespace

std::optional<ValidationError> ValidateDevicePayload(const DevicePayload& payload,
                                                     bool require_status) {
  for (const auto& key : BaseRequiredFields()) {
    if (auto err = CheckRequired(payload, key)) return err;
  }

  const PayloadField* status = Find(payload, "status");
  if (require_status) {
    if (auto err = CheckRequired(payload, "status")) return err;
  } else if (status != nullptr && !status->is_string) {
    return ValidationError{"status", "must be a string"};
  }

  if (!common::net::IsIpv4Literal(Find(payload, "ip_address")->text)) {
    return ValidationError{"ip_address", "must be a valid IPv4 address"};
  }

  if (!model::ParseDeviceType(Find(payload, "type")->text).has_value()) {
    return ValidationError{"type", "must be one of router, switch, server"};
  }

  if (status != nullptr && !model::ParseDeviceStatus(status->text).has_value()) {
    return ValidationError{"status", "must be one of online, offline"};
  }

  return std::nullopt;
}

bool ParseDeviceInput(const DevicePayload& payload, bool require_status,
                      model::DeviceInput& out, ValidationError& err) {
  if (auto e = ValidateDevicePayload(payload, require_status)) {
    err = std::move(*e);
    return false;
  }

  model::DeviceInput in;
  in.name = payload.at("name").text;
  in.ip_address = payload.at("ip_address").text;
  in.type = *model::ParseDeviceType(payload.at("type").text);
  in.location = payload.at("location").text;
  if (const PayloadField* status = Find(payload, "status")) {
    in.status = model::ParseDeviceStatus(status->text);
  }
  out = std::move(in);
  return true;
}

}  // namespace validation
}  // namespace device
}  // namespace core
}  // namespace devinv
