#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "core/device/probe/icmp_probe.hpp"

namespace probe = devinv::core::device::probe;

TEST(IcmpProbeTest, RejectsNonAddressHost) {
  probe::IcmpProbe p;
  EXPECT_THROW(p.Probe("router.local", std::chrono::milliseconds(100)), std::invalid_argument);
  EXPECT_THROW(p.Probe("10.0.0", std::chrono::milliseconds(100)), std::invalid_argument);
}

// Loopback always answers when ICMP sockets are allowed.
TEST(IcmpProbeTest, LoopbackRepliesOrIsDenied) {
  probe::IcmpProbe p;
  const auto outcome = p.Ping("127.0.0.1", std::chrono::milliseconds(500));
  EXPECT_TRUE(outcome == probe::ProbeOutcome::Reply ||
              outcome == probe::ProbeOutcome::PermissionDenied)
      << probe::ToString(outcome);
}

// Whatever the host does, the probe returns within its deadline.
TEST(IcmpProbeTest, ProbeIsBoundedByTimeout) {
  probe::IcmpProbe p;
  const auto start = std::chrono::steady_clock::now();
  (void)p.Probe("192.0.2.1", std::chrono::milliseconds(200));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(IcmpProbeTest, OutcomeNames) {
  EXPECT_STREQ(probe::ToString(probe::ProbeOutcome::Reply), "reply");
  EXPECT_STREQ(probe::ToString(probe::ProbeOutcome::Timeout), "timeout");
}
