#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "core/device/manager/device_service.hpp"
#include "test_doubles.hpp"

namespace manager = devinv::core::device::manager;
namespace model = devinv::core::device::model;
namespace validation = devinv::core::device::validation;
using devinv::core::common::error::ErrorCode;
using devinv::test_support::FakeProbe;
using devinv::test_support::FakeRepository;

namespace {

validation::DevicePayload Payload(const std::string& name, const std::string& ip) {
  return {
      {"name", {name, true}},
      {"ip_address", {ip, true}},
      {"type", {"server", true}},
      {"location", {"dc1", true}},
  };
}

class DeviceServiceTest : public ::testing::Test {
protected:
  DeviceServiceTest()
      : repo_(std::make_shared<FakeRepository>()),
        probe_(std::make_shared<FakeProbe>()),
        service_(repo_, probe_, manager::DeviceService::Options{}) {}

  model::Device Create(const std::string& name, const std::string& ip) {
    model::Device d;
    const auto st = service_.CreateDevice(Payload(name, ip), d);
    EXPECT_TRUE(st.IsOk()) << st.message;
    return d;
  }

  std::shared_ptr<FakeRepository> repo_;
  std::shared_ptr<FakeProbe> probe_;
  manager::DeviceService service_;
};

}  // namespace

TEST_F(DeviceServiceTest, CreateDefaultsToOffline) {
  const auto d = Create("db01", "10.0.0.1");
  EXPECT_EQ(d.status, model::DeviceStatus::Offline);

  auto p = Payload("db02", "10.0.0.2");
  p["status"] = {"online", true};
  model::Device online;
  ASSERT_TRUE(service_.CreateDevice(p, online).IsOk());
  EXPECT_EQ(online.status, model::DeviceStatus::Online);
}

TEST_F(DeviceServiceTest, InvalidInputCarriesDetails) {
  auto p = Payload("db01", "300.0.0.1");
  model::Device d;
  const auto st = service_.CreateDevice(p, d);
  EXPECT_EQ(st.code, ErrorCode::Validation);
  EXPECT_EQ(st.message, "Invalid input");
  EXPECT_EQ(st.details, "ip_address: must be a valid IPv4 address");
}

TEST_F(DeviceServiceTest, DuplicateAddressIsConflict) {
  Create("a", "10.0.0.1");
  model::Device d;
  const auto st = service_.CreateDevice(Payload("b", "10.0.0.1"), d);
  EXPECT_EQ(st.code, ErrorCode::Conflict);
  EXPECT_EQ(st.message, "Device with this IP already exists");
}

TEST_F(DeviceServiceTest, UpdateRequiresStatus) {
  const auto d = Create("a", "10.0.0.1");
  model::Device out;
  const auto st = service_.UpdateDevice(std::to_string(d.id), Payload("a", "10.0.0.1"), out);
  EXPECT_EQ(st.code, ErrorCode::Validation);
  EXPECT_EQ(st.details, "status: field required");
}

TEST_F(DeviceServiceTest, CheckStatusProbesStoredAddressAndPersists) {
  const auto d = Create("a", "10.0.0.7");
  probe_->reachable["10.0.0.7"] = true;

  manager::StatusReport report;
  ASSERT_TRUE(service_.CheckStatus(std::to_string(d.id), report).IsOk());
  EXPECT_EQ(report.status, model::DeviceStatus::Online);
  EXPECT_TRUE(report.persisted);
  EXPECT_FALSE(report.last_checked.empty());
  ASSERT_EQ(probe_->probed.size(), 1u);
  EXPECT_EQ(probe_->probed[0], "10.0.0.7");
  EXPECT_EQ(repo_->StoredStatus(d.id), report.status);
}

TEST_F(DeviceServiceTest, CheckStatusUnknownIdIsNotFound) {
  manager::StatusReport report;
  EXPECT_EQ(service_.CheckStatus("42", report).code, ErrorCode::NotFound);
  EXPECT_EQ(service_.CheckStatus("10.0.0.1", report).code, ErrorCode::NotFound);
  EXPECT_TRUE(probe_->probed.empty());
}

TEST_F(DeviceServiceTest, DegradedCheckStatusProbesLiteralAddress) {
  repo_->available = false;
  probe_->reachable["192.168.5.5"] = true;

  manager::StatusReport report;
  ASSERT_TRUE(service_.CheckStatus("192.168.5.5", report).IsOk());
  EXPECT_EQ(report.status, model::DeviceStatus::Online);
  EXPECT_FALSE(report.device_id.has_value());
  EXPECT_FALSE(report.persisted);
  ASSERT_EQ(probe_->probed.size(), 1u);
}

TEST_F(DeviceServiceTest, DegradedCheckStatusWithoutAddressIsOffline) {
  repo_->available = false;

  manager::StatusReport report;
  ASSERT_TRUE(service_.CheckStatus("17", report).IsOk());
  EXPECT_EQ(report.status, model::DeviceStatus::Offline);
  EXPECT_TRUE(probe_->probed.empty());
}

TEST_F(DeviceServiceTest, LookupFailureDegrades) {
  Create("a", "10.0.0.1");
  repo_->fail_find = true;

  manager::StatusReport report;
  ASSERT_TRUE(service_.CheckStatus("1", report).IsOk());
  EXPECT_EQ(report.status, model::DeviceStatus::Offline);
  EXPECT_TRUE(probe_->probed.empty());
}

TEST_F(DeviceServiceTest, ProbeFailureReportsOffline) {
  const auto d = Create("a", "10.0.0.1");
  probe_->throw_on_probe = true;

  manager::StatusReport report;
  ASSERT_TRUE(service_.CheckStatus(std::to_string(d.id), report).IsOk());
  EXPECT_EQ(report.status, model::DeviceStatus::Offline);
  EXPECT_EQ(repo_->StoredStatus(d.id), model::DeviceStatus::Offline);
}

TEST_F(DeviceServiceTest, StatusWriteFailureStillAnswers) {
  const auto d = Create("a", "10.0.0.1");
  probe_->reachable["10.0.0.1"] = true;
  repo_->fail_status_write = true;

  manager::StatusReport report;
  ASSERT_TRUE(service_.CheckStatus(std::to_string(d.id), report).IsOk());
  EXPECT_EQ(report.status, model::DeviceStatus::Online);
  EXPECT_FALSE(report.persisted);
}

TEST_F(DeviceServiceTest, HealthReflectsStore) {
  EXPECT_TRUE(service_.CheckHealth().db_available);

  repo_->available = false;
  const auto h = service_.CheckHealth();
  EXPECT_FALSE(h.db_available);
  EXPECT_EQ(h.error, "connection refused");
}
