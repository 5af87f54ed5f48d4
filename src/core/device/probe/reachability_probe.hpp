#pragma once

#include <chrono>
#include <string>

namespace devinv {
namespace core {
namespace device {
namespace probe {

class ReachabilityProbe {
public:
  virtual ~ReachabilityProbe() = default;

  // True when `host` answered within `timeout`. Network and platform failures
  // yield false; throws std::invalid_argument when `host` is not an IPv4
  // literal.
  virtual bool Probe(const std::string& host, std::chrono::milliseconds timeout) = 0;
};

}  // namespace probe
}  // namespace device
}  // namespace core
}  // namespace devinv
