#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devinv::core::common::net {

using Ipv4Octets = std::array<std::uint8_t, 4>;

inline bool IsValidPort(std::int64_t port) {
  return port >= 1 && port <= 65535;
}

inline std::string JoinHostPort(std::string_view host, std::uint16_t port) {
  return std::string(host) + ":" + std::to_string(port);
}

// Strict dotted-decimal: exactly four octets of 1-3 digits, each 0-255.
// Leading zeros ("010"), signs and whitespace are rejected, so every accepted
// string is the canonical spelling of its address.
inline std::optional<Ipv4Octets> ParseIpv4(std::string_view s) {
  Ipv4Octets out{};
  std::size_t octet = 0;
  std::size_t i = 0;
  while (true) {
    std::uint32_t v = 0;
    std::size_t digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
      if (digits == 1 && v == 0) return std::nullopt;
      v = v * 10 + static_cast<std::uint32_t>(s[i] - '0');
      ++digits;
      ++i;
      if (digits > 3) return std::nullopt;
    }
    if (digits == 0 || v > 255) return std::nullopt;
    out[octet++] = static_cast<std::uint8_t>(v);

    if (octet == 4) break;
    if (i >= s.size() || s[i] != '.') return std::nullopt;
    ++i;
  }
  if (i != s.size()) return std::nullopt;
  return out;
}

inline bool IsIpv4Literal(std::string_view s) {
  return ParseIpv4(s).has_value();
}

}  // namespace devinv::core::common::net
