#pragma once

#include <string_view>
#include <vector>

#include "core/common/error/status.hpp"
#include "core/device/model/device_entity.hpp"

namespace devinv::core::device::storage {

using common::error::Status;

// Persistent collection of device records. Every operation reports
// ErrorCode::Unavailable when the backing store cannot be reached, which is
// distinct from NotFound. Identifiers are client strings; an identifier that
// does not resolve is reported exactly like a missing record.
class DeviceRepository {
public:
  virtual ~DeviceRepository() = default;

  // Ok, or Unavailable with the cause in details.
  virtual Status CheckAvailable() = 0;

  // Sorted by name, then id.
  virtual Status List(std::vector<model::Device>& out) = 0;

  // DuplicateKey when another record holds input.ip_address.
  virtual Status Create(const model::DeviceInput& input, model::Device& out) = 0;

  virtual Status Find(std::string_view id, model::Device& out) = 0;

  // Replaces every mutable field; input.status must be set.
  virtual Status Update(std::string_view id, const model::DeviceInput& input,
                        model::Device& out) = 0;

  virtual Status Delete(std::string_view id) = 0;

  // Writes status and updated_at only.
  virtual Status UpdateStatus(model::DeviceId id, model::DeviceStatus status) = 0;
};

}  // namespace devinv::core::device::storage
