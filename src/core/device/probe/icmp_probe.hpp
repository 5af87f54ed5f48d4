#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "core/common/logger/logger.hpp"
#include "core/device/probe/reachability_probe.hpp"

namespace devinv::core::device::probe {

enum class ProbeOutcome {
  Reply,
  Timeout,
  Unreachable,
  PermissionDenied,
  SocketError,
  SendFailed,
  ReceiveFailed
};

const char* ToString(ProbeOutcome outcome);

// Single ICMP echo per call. Prefers an unprivileged datagram ICMP socket
// (net.ipv4.ping_group_range) and falls back to a raw socket.
class IcmpProbe final : public ReachabilityProbe {
public:
  explicit IcmpProbe(std::shared_ptr<common::log::Logger> logger = nullptr);

  bool Probe(const std::string& host, std::chrono::milliseconds timeout) override;

  // Same as Probe() but keeps the failure class.
  ProbeOutcome Ping(const std::string& host, std::chrono::milliseconds timeout);

private:
  std::shared_ptr<common::log::Logger> logger_;
  std::atomic<std::uint16_t> next_seq_{1};
};

}  // namespace devinv::core::device::probe
