#pragma once

#include <string>
#include <vector>

#include "core/common/error/status.hpp"
#include "core/device/manager/device_service.hpp"
#include "core/device/model/device_entity.hpp"
#include "core/device/validation/device_validator.hpp"

namespace devinv::services::web_services::api {

std::string DeviceToJson(const devinv::core::device::model::Device& d);
std::string DeviceListToJson(const std::vector<devinv::core::device::model::Device>& devices);
std::string StatusReportToJson(const devinv::core::device::manager::StatusReport& r);

// {"success":true,"data":<data>}
std::string SuccessEnvelope(const std::string& data);

// {"success":false,"error":...,"details":...}; details omitted when empty.
std::string ErrorEnvelope(const std::string& error, const std::string& details = std::string());
std::string ErrorEnvelope(const devinv::core::common::error::Status& st);

// Reads the known device fields of a JSON object. A body that is not a JSON
// object yields an empty payload; null members count as absent.
devinv::core::device::validation::DevicePayload ParseDevicePayload(const std::string& body);

}  // namespace devinv::services::web_services::api
