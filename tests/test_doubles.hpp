#pragma once

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "core/device/probe/reachability_probe.hpp"
#include "core/device/storage/device_repository.hpp"
#include "core/device/storage/identifier_resolver.hpp"

namespace devinv::test_support {

namespace model = devinv::core::device::model;
using devinv::core::common::error::ErrorCode;
using devinv::core::common::error::Status;

// Answers from a fixed reachability table; unknown hosts are unreachable.
class FakeProbe final : public devinv::core::device::probe::ReachabilityProbe {
public:
  bool Probe(const std::string& host, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lk(mu_);
    probed.push_back(host);
    if (throw_on_probe) throw std::runtime_error("probe exploded");
    return reachable.count(host) != 0;
  }

  std::vector<std::string> probed;
  std::map<std::string, bool> reachable;
  bool throw_on_probe = false;

private:
  std::mutex mu_;
};

// In-memory repository whose availability and status writes can be switched off.
class FakeRepository final : public devinv::core::device::storage::DeviceRepository {
public:
  Status CheckAvailable() override {
    return available ? Status::Ok() : Down();
  }

  Status List(std::vector<model::Device>& out) override {
    if (!available) return Down();
    out.clear();
    for (const auto& kv : rows_) out.push_back(kv.second);
    return Status::Ok();
  }

  Status Create(const model::DeviceInput& input, model::Device& out) override {
    if (!available) return Down();
    for (const auto& kv : rows_) {
      if (kv.second.ip_address == input.ip_address) {
        return Status::Error(ErrorCode::DuplicateKey, "Duplicate key");
      }
    }
    model::Device d;
    d.id = next_id_++;
    d.name = input.name;
    d.ip_address = input.ip_address;
    d.type = input.type;
    d.location = input.location;
    d.status = input.status.value_or(model::DeviceStatus::Offline);
    rows_[d.id] = d;
    out = d;
    return Status::Ok();
  }

  Status Find(std::string_view id, model::Device& out) override {
    if (!available || fail_find) return Down();
    const auto key = devinv::core::device::storage::ResolveIdentifier(id);
    if (!key.has_value() || rows_.count(*key) == 0) {
      return Status::Error(ErrorCode::NotFound, "Device not found");
    }
    out = rows_[*key];
    return Status::Ok();
  }

  Status Update(std::string_view id, const model::DeviceInput& input,
                model::Device& out) override {
    model::Device d;
    Status st = Find(id, d);
    if (!st.IsOk()) return st;
    for (const auto& kv : rows_) {
      if (kv.first != d.id && kv.second.ip_address == input.ip_address) {
        return Status::Error(ErrorCode::DuplicateKey, "Duplicate key");
      }
    }
    d.name = input.name;
    d.ip_address = input.ip_address;
    d.type = input.type;
    d.location = input.location;
    d.status = input.status.value_or(d.status);
    rows_[d.id] = d;
    out = d;
    return Status::Ok();
  }

  Status Delete(std::string_view id) override {
    model::Device d;
    Status st = Find(id, d);
    if (!st.IsOk()) return st;
    rows_.erase(d.id);
    return Status::Ok();
  }

  Status UpdateStatus(model::DeviceId id, model::DeviceStatus status) override {
    if (!available || fail_status_write) return Down();
    if (rows_.count(id) == 0) return Status::Error(ErrorCode::NotFound, "Device not found");
    rows_[id].status = status;
    return Status::Ok();
  }

  model::DeviceStatus StoredStatus(model::DeviceId id) { return rows_.at(id).status; }

  bool available = true;
  bool fail_find = false;
  bool fail_status_write = false;

private:
  static Status Down() {
    return Status::Error(ErrorCode::Unavailable, "Database unavailable", "connection refused");
  }

  std::map<model::DeviceId, model::Device> rows_;
  model::DeviceId next_id_ = 1;
};

}  // namespace devinv::test_support
