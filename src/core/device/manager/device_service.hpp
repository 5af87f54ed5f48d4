#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/common/error/status.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/model/device_entity.hpp"
#include "core/device/probe/reachability_probe.hpp"
#include "core/device/storage/device_repository.hpp"
#include "core/device/validation/device_validator.hpp"

namespace devinv {
namespace core {
namespace device {
namespace manager {

using common::error::Status;

struct StatusReport {
  model::DeviceStatus status = model::DeviceStatus::Offline;
  std::string last_checked;
  // Set when the identifier resolved to a stored device.
  std::optional<model::DeviceId> device_id;
  bool persisted = false;
};

struct HealthReport {
  bool db_available = false;
  std::string error;
};

class DeviceService {
public:
  struct Options {
    std::chrono::milliseconds probe_timeout{2000};
  };

  DeviceService(std::shared_ptr<storage::DeviceRepository> repository,
                std::shared_ptr<probe::ReachabilityProbe> probe, Options opt,
                std::shared_ptr<common::log::Logger> logger = nullptr);

  Status ListDevices(std::vector<model::Device>& out);
  Status CreateDevice(const validation::DevicePayload& payload, model::Device& out);
  Status GetDevice(std::string_view id, model::Device& out);
  Status UpdateDevice(std::string_view id, const validation::DevicePayload& payload,
                      model::Device& out);
  Status DeleteDevice(std::string_view id);

  // Re-measures reachability and overwrites the stored status. Answers even
  // when the store is down: `id` is then probed as a literal IPv4 address, and
  // anything else is reported offline. Fails only with NotFound, and only
  // while the store is reachable.
  Status CheckStatus(std::string_view id, StatusReport& out);

  HealthReport CheckHealth();

private:
  Status MapWriteError(Status st) const;
  bool ProbeAddress(const std::string& address);

private:
  std::shared_ptr<storage::DeviceRepository> repository_;
  std::shared_ptr<probe::ReachabilityProbe> probe_;
  Options opt_;
  std::shared_ptr<common::log::Logger> logger_;
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devinv
