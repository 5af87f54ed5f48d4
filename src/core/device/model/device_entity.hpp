#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/device/model/device_status.hpp"

namespace devinv {
namespace core {
namespace device {
namespace model {

using DeviceId = std::int64_t;

struct Device {
  DeviceId id = 0;
  std::string name;
  std::string ip_address;
  DeviceType type = DeviceType::Router;
  std::string location;
  DeviceStatus status = DeviceStatus::Offline;
  std::string created_at;
  std::string updated_at;
};

// Validated fields for create and update. `status` is always set for update;
// for create an unset status means offline.
struct DeviceInput {
  std::string name;
  std::string ip_address;
  DeviceType type = DeviceType::Router;
  std::string location;
  std::optional<DeviceStatus> status;
};

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devinv
