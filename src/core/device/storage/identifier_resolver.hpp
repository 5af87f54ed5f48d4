#pragma once

#include <optional>
#include <string_view>

#include "core/device/model/device_entity.hpp"

namespace devinv::core::device::storage {

// Maps a client identifier to a row id. Only a plain positive decimal that
// fits in int64 resolves; anything else yields nullopt, which callers report
// as "not found".
std::optional<model::DeviceId> ResolveIdentifier(std::string_view raw);

}  // namespace devinv::core::device::storage
