#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/device/storage/device_repository.hpp"
#include "core/device/storage/sqlite_store.hpp"

namespace devinv::core::device::storage {

// Device records in a single "devices" table. IP uniqueness is a UNIQUE index,
// so concurrent writers cannot both commit the same address.
class SqliteDeviceRepository final : public DeviceRepository {
public:
  SqliteDeviceRepository(std::shared_ptr<SqliteStore> store,
                         std::shared_ptr<common::log::Logger> logger = nullptr);

  Status CheckAvailable() override;
  Status List(std::vector<model::Device>& out) override;
  Status Create(const model::DeviceInput& input, model::Device& out) override;
  Status Find(std::string_view id, model::Device& out) override;
  Status Update(std::string_view id, const model::DeviceInput& input,
                model::Device& out) override;
  Status Delete(std::string_view id) override;
  Status UpdateStatus(model::DeviceId id, model::DeviceStatus status) override;

  // Creates the table and indexes if missing.
  static Status EnsureSchema(sqlite3* db);

private:
  std::shared_ptr<SqliteStore> store_;
  std::shared_ptr<common::log::Logger> logger_;
};

}  // namespace devinv::core::device::storage
