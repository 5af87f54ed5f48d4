#pragma once

#include <optional>
#include <string_view>

namespace devinv {
namespace core {
namespace device {
namespace model {

enum class DeviceStatus {
  Online,
  Offline
};

enum class DeviceType {
  Router,
  Switch,
  Server
};

inline const char* ToString(DeviceStatus s) {
  switch (s) {
    case DeviceStatus::Online: return "online";
    case DeviceStatus::Offline: return "offline";
  }
  return "offline";
}

inline const char* ToString(DeviceType t) {
  switch (t) {
    case DeviceType::Router: return "router";
    case DeviceType::Switch: return "switch";
    case DeviceType::Server: return "server";
  }
  return "router";
}

// Exact, case-sensitive match.
inline std::optional<DeviceStatus> ParseDeviceStatus(std::string_view s) {
  if (s == "online") return DeviceStatus::Online;
  if (s == "offline") return DeviceStatus::Offline;
  return std::nullopt;
}

inline std::optional<DeviceType> ParseDeviceType(std::string_view s) {
  if (s == "router") return DeviceType::Router;
  if (s == "switch") return DeviceType::Switch;
  if (s == "server") return DeviceType::Server;
  return std::nullopt;
}

inline DeviceStatus StatusFromReachable(bool reachable) {
  return reachable ? DeviceStatus::Online : DeviceStatus::Offline;
}

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devinv
