#include "core/device/manager/device_service.hpp"

#include <exception>
#include <string>
#include <utility>

#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace devinv {
namespace core {
namespace device {
namespace manager {

using common::error::ErrorCode;

namespace {

Status InvalidInput(const validation::ValidationError& err) {
  return Status::Error(ErrorCode::Validation, "Invalid input", err.Describe());
}

}  // namespace

DeviceService::DeviceService(std::shared_ptr<storage::DeviceRepository> repository,
                             std::shared_ptr<probe::ReachabilityProbe> probe, Options opt,
                             std::shared_ptr<common::log::Logger> logger)
    : repository_(std::move(repository)),
      probe_(std::move(probe)),
      opt_(opt),
      logger_(std::move(logger)) {}

Status DeviceService::ListDevices(std::vector<model::Device>& out) {
  return repository_->List(out);
}

Status DeviceService::CreateDevice(const validation::DevicePayload& payload, model::Device& out) {
  model::DeviceInput input;
  validation::ValidationError err;
  if (!validation::ParseDeviceInput(payload, false, input, err)) return InvalidInput(err);
  if (!input.status.has_value()) input.status = model::DeviceStatus::Offline;

  Status st = repository_->Create(input, out);
  if (st.IsOk() && logger_) {
    logger_->Info("device created id=" + std::to_string(out.id) + " ip=" + out.ip_address);
  }
  return MapWriteError(std::move(st));
}

Status DeviceService::GetDevice(std::string_view id, model::Device& out) {
  return repository_->Find(id, out);
}

Status DeviceService::UpdateDevice(std::string_view id, const validation::DevicePayload& payload,
                                   model::Device& out) {
  model::DeviceInput input;
  validation::ValidationError err;
  if (!validation::ParseDeviceInput(payload, true, input, err)) return InvalidInput(err);

  Status st = repository_->Update(id, input, out);
  if (st.IsOk() && logger_) logger_->Info("device updated id=" + std::to_string(out.id));
  return MapWriteError(std::move(st));
}

Status DeviceService::DeleteDevice(std::string_view id) {
  Status st = repository_->Delete(id);
  if (st.IsOk() && logger_) logger_->Info("device deleted id=" + std::string(id));
  return st;
}

Status DeviceService::CheckStatus(std::string_view id, StatusReport& out) {
  StatusReport report;
  std::optional<std::string> address;

  bool store_ok = repository_->CheckAvailable().IsOk();
  if (store_ok) {
    model::Device device;
    const Status st = repository_->Find(id, device);
    if (st.IsOk()) {
      address = device.ip_address;
      report.device_id = device.id;
    } else if (st.code == ErrorCode::NotFound) {
      return st;
    } else {
      if (logger_) logger_->Warn("status check: lookup failed, degrading: " + st.details);
      store_ok = false;
    }
  }

  if (!store_ok && common::net::IsIpv4Literal(id)) address = std::string(id);

  bool reachable = false;
  if (address.has_value()) {
    reachable = ProbeAddress(*address);
  } else if (logger_) {
    logger_->Debug("status check: no address for '" + std::string(id) + "', reporting offline");
  }

  report.status = model::StatusFromReachable(reachable);
  report.last_checked = common::time::NowIso8601Utc();

  if (report.device_id.has_value()) {
    const Status wst = repository_->UpdateStatus(*report.device_id, report.status);
    report.persisted = wst.IsOk();
    if (!wst.IsOk() && logger_) {
      logger_->Warn("status check: could not persist status for id=" +
                    std::to_string(*report.device_id) + ": " + wst.message + " " + wst.details);
    }
  }

  out = std::move(report);
  return Status::Ok();
}

HealthReport DeviceService::CheckHealth() {
  HealthReport report;
  const Status st = repository_->CheckAvailable();
  report.db_available = st.IsOk();
  if (!st.IsOk()) report.error = st.details.empty() ? st.message : st.details;
  return report;
}

Status DeviceService::MapWriteError(Status st) const {
  if (st.code == ErrorCode::DuplicateKey) {
    return Status::Error(ErrorCode::Conflict, "Device with this IP already exists", st.details);
  }
  return st;
}

bool DeviceService::ProbeAddress(const std::string& address) {
  try {
    return probe_->Probe(address, opt_.probe_timeout);
  } catch (const std::exception& e) {
    if (logger_) logger_->Warn(std::string("status check: probe failed: ") + e.what());
    return false;
  }
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devinv
