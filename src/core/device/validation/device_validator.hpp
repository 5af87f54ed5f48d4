#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "core/device/model/device_entity.hpp"

namespace devinv {
namespace core {
namespace device {
namespace validation {

// Raw value of one request field. Non-string JSON values keep their literal
// text with is_string=false; JSON null is not represented (treated as absent).
struct PayloadField {
  std::string text;
  bool is_string = true;
};

using DevicePayload = std::unordered_map<std::string, PayloadField>;

struct ValidationError {
  std::string field;
  std::string reason;

  std::string Describe() const { return field + ": " + reason; }
};

// Rules, first failure wins:
//   1. name, ip_address, type, location (and status if require_status) are
//      present, strings, and non-empty
//   2. ip_address is a dotted-decimal IPv4 address
//   3. type is router|switch|server
//   4. status is online|offline when required or supplied
std::optional<ValidationError> ValidateDevicePayload(const DevicePayload& payload,
                                                     bool require_status);

bool ParseDeviceInput(const DevicePayload& payload, bool require_status,
                      model::DeviceInput& out, ValidationError& err);

}  // namespace validation
}  // namespace device
}  // namespace core
}  // namespace devinv
