#include "core/device/storage/identifier_resolver.hpp"

#include <cstdint>
#include <limits>

namespace devinv::core::device::storage {

std::optional<model::DeviceId> ResolveIdentifier(std::string_view raw) {
  if (raw.empty()) return std::nullopt;

  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  std::int64_t v = 0;
  for (const char c : raw) {
    if (c < '0' || c > '9') return std::nullopt;
    const int d = c - '0';
    if (v > (kMax - d) / 10) return std::nullopt;
    v = v * 10 + d;
  }
  if (v == 0) return std::nullopt;
  return v;
}

}  // namespace devinv::core::device::storage
