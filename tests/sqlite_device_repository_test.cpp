#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/device/storage/sqlite_device_repository.hpp"
#include "core/device/storage/sqlite_store.hpp"

namespace storage = devinv::core::device::storage;
namespace model = devinv::core::device::model;
using devinv::core::common::error::ErrorCode;

namespace {

model::DeviceInput MakeInput(const std::string& name, const std::string& ip,
                             model::DeviceType type = model::DeviceType::Switch) {
  model::DeviceInput in;
  in.name = name;
  in.ip_address = ip;
  in.type = type;
  in.location = "lab";
  return in;
}

class SqliteDeviceRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_shared<storage::SqliteStore>(storage::SqliteStore::Options{});
    repo_ = std::make_unique<storage::SqliteDeviceRepository>(store_);
  }

  model::Device CreateOk(const std::string& name, const std::string& ip) {
    model::Device d;
    const auto st = repo_->Create(MakeInput(name, ip), d);
    EXPECT_TRUE(st.IsOk()) << st.message << " " << st.details;
    return d;
  }

  std::shared_ptr<storage::SqliteStore> store_;
  std::unique_ptr<storage::SqliteDeviceRepository> repo_;
};

}  // namespace

TEST_F(SqliteDeviceRepositoryTest, CreateAssignsIdAndTimestamps) {
  const auto d = CreateOk("edge", "10.1.1.1");
  EXPECT_GT(d.id, 0);
  EXPECT_EQ(d.status, model::DeviceStatus::Offline);
  EXPECT_FALSE(d.created_at.empty());
  EXPECT_EQ(d.created_at, d.updated_at);

  model::Device found;
  ASSERT_TRUE(repo_->Find(std::to_string(d.id), found).IsOk());
  EXPECT_EQ(found.name, "edge");
  EXPECT_EQ(found.ip_address, "10.1.1.1");
  EXPECT_EQ(found.type, model::DeviceType::Switch);
}

TEST_F(SqliteDeviceRepositoryTest, ListIsSortedByName) {
  CreateOk("charlie", "10.0.0.3");
  CreateOk("alpha", "10.0.0.1");
  CreateOk("bravo", "10.0.0.2");

  std::vector<model::Device> all;
  ASSERT_TRUE(repo_->List(all).IsOk());
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].name, "alpha");
  EXPECT_EQ(all[1].name, "bravo");
  EXPECT_EQ(all[2].name, "charlie");
}

TEST_F(SqliteDeviceRepositoryTest, DuplicateAddressIsRejected) {
  CreateOk("a", "10.0.0.9");
  model::Device d;
  const auto st = repo_->Create(MakeInput("b", "10.0.0.9"), d);
  EXPECT_EQ(st.code, ErrorCode::DuplicateKey);

  std::vector<model::Device> all;
  ASSERT_TRUE(repo_->List(all).IsOk());
  EXPECT_EQ(all.size(), 1u);
}

TEST_F(SqliteDeviceRepositoryTest, UpdateKeepsOwnAddressButNotAnothers) {
  const auto a = CreateOk("a", "10.0.0.1");
  const auto b = CreateOk("b", "10.0.0.2");

  auto in = MakeInput("a-renamed", "10.0.0.1", model::DeviceType::Server);
  in.status = model::DeviceStatus::Online;
  model::Device updated;
  ASSERT_TRUE(repo_->Update(std::to_string(a.id), in, updated).IsOk());
  EXPECT_EQ(updated.name, "a-renamed");
  EXPECT_EQ(updated.status, model::DeviceStatus::Online);
  EXPECT_EQ(updated.created_at, a.created_at);

  in.ip_address = "10.0.0.2";
  EXPECT_EQ(repo_->Update(std::to_string(a.id), in, updated).code, ErrorCode::DuplicateKey);

  model::Device still;
  ASSERT_TRUE(repo_->Find(std::to_string(b.id), still).IsOk());
  EXPECT_EQ(still.name, "b");
}

TEST_F(SqliteDeviceRepositoryTest, UpdateRequiresStatus) {
  const auto a = CreateOk("a", "10.0.0.1");
  model::Device out;
  EXPECT_EQ(repo_->Update(std::to_string(a.id), MakeInput("a", "10.0.0.1"), out).code,
            ErrorCode::Validation);
}

TEST_F(SqliteDeviceRepositoryTest, MissingAndMalformedIdsAreNotFound) {
  model::Device d;
  EXPECT_EQ(repo_->Find("999", d).code, ErrorCode::NotFound);
  EXPECT_EQ(repo_->Find("abc", d).code, ErrorCode::NotFound);
  EXPECT_EQ(repo_->Delete("abc").code, ErrorCode::NotFound);

  auto in = MakeInput("x", "10.0.0.5");
  in.status = model::DeviceStatus::Offline;
  EXPECT_EQ(repo_->Update("12x", in, d).code, ErrorCode::NotFound);
  EXPECT_EQ(repo_->UpdateStatus(999, model::DeviceStatus::Online).code, ErrorCode::NotFound);
}

TEST_F(SqliteDeviceRepositoryTest, DeleteRemovesRecordAndFreesAddress) {
  const auto a = CreateOk("a", "10.0.0.1");
  ASSERT_TRUE(repo_->Delete(std::to_string(a.id)).IsOk());

  model::Device d;
  EXPECT_EQ(repo_->Find(std::to_string(a.id), d).code, ErrorCode::NotFound);
  EXPECT_EQ(repo_->Delete(std::to_string(a.id)).code, ErrorCode::NotFound);

  const auto b = CreateOk("b", "10.0.0.1");
  EXPECT_NE(b.id, a.id);
}

TEST_F(SqliteDeviceRepositoryTest, UpdateStatusTouchesOnlyStatus) {
  const auto a = CreateOk("a", "10.0.0.1");
  ASSERT_TRUE(repo_->UpdateStatus(a.id, model::DeviceStatus::Online).IsOk());

  model::Device d;
  ASSERT_TRUE(repo_->Find(std::to_string(a.id), d).IsOk());
  EXPECT_EQ(d.status, model::DeviceStatus::Online);
  EXPECT_EQ(d.name, "a");
  EXPECT_EQ(d.ip_address, "10.0.0.1");
}

TEST_F(SqliteDeviceRepositoryTest, ConcurrentCreatesWithSameAddressYieldOneRecord) {
  constexpr int kWriters = 8;
  std::atomic<int> ok{0};
  std::atomic<int> dup{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([&, i] {
      model::Device d;
      const auto st = repo_->Create(MakeInput("dev" + std::to_string(i), "10.9.9.9"), d);
      if (st.IsOk()) ++ok;
      else if (st.code == ErrorCode::DuplicateKey) ++dup;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(dup.load(), kWriters - 1);
}

TEST(SqliteStoreTest, UnreachableDatabaseIsUnavailable) {
  storage::SqliteStore::Options opt;
  opt.path = "/nonexistent-devinv-dir/sub/devices.sqlite3";
  auto store = std::make_shared<storage::SqliteStore>(opt);
  storage::SqliteDeviceRepository repo(store);

  EXPECT_EQ(repo.CheckAvailable().code, ErrorCode::Unavailable);

  std::vector<model::Device> all;
  EXPECT_EQ(repo.List(all).code, ErrorCode::Unavailable);

  model::Device d;
  EXPECT_EQ(repo.Create(MakeInput("a", "10.0.0.1"), d).code, ErrorCode::Unavailable);
  EXPECT_EQ(repo.Find("1", d).code, ErrorCode::Unavailable);
  EXPECT_EQ(repo.Find("abc", d).code, ErrorCode::Unavailable);
  EXPECT_EQ(repo.Delete("1").code, ErrorCode::Unavailable);
}
