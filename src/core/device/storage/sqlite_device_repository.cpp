#include "core/device/storage/sqlite_device_repository.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include "core/common/utils/time_utils.hpp"
#include "core/device/storage/identifier_resolver.hpp"

namespace devinv::core::device::storage {

using common::error::ErrorCode;

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS devices ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "name TEXT NOT NULL, "
    "ip_address TEXT NOT NULL, "
    "type TEXT NOT NULL CHECK (type IN ('router', 'switch', 'server')), "
    "location TEXT NOT NULL, "
    "status TEXT NOT NULL DEFAULT 'offline' CHECK (status IN ('online', 'offline')), "
    "created_at TEXT NOT NULL, "
    "updated_at TEXT NOT NULL"
    ");"
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_devices_ip_address ON devices(ip_address);"
    "CREATE INDEX IF NOT EXISTS idx_devices_type ON devices(type);"
    "CREATE INDEX IF NOT EXISTS idx_devices_status ON devices(status);";

constexpr const char* kColumns =
    "id, name, ip_address, type, location, status, created_at, updated_at";

Status NotFound() {
  return Status::Error(ErrorCode::NotFound, "Device not found");
}

class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
  }

  ~Statement() {
    if (stmt_ != nullptr) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
  int PrepareCode() const { return rc_; }

  void Bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void Bind(int idx, const char* v) { sqlite3_bind_text(stmt_, idx, v, -1, SQLITE_STATIC); }
  void Bind(int idx, std::int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }

  int Step() { return sqlite3_step(stmt_); }

  std::int64_t Int64(int col) const { return sqlite3_column_int64(stmt_, col); }

  std::string Text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    if (t == nullptr) return std::string();
    return std::string(reinterpret_cast<const char*>(t),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
  }

private:
  sqlite3_stmt* stmt_ = nullptr;
  int rc_ = SQLITE_OK;
};

bool ReadDevice(const Statement& st, model::Device& out) {
  model::Device d;
  d.id = st.Int64(0);
  d.name = st.Text(1);
  d.ip_address = st.Text(2);
  const auto type = model::ParseDeviceType(st.Text(3));
  d.location = st.Text(4);
  const auto status = model::ParseDeviceStatus(st.Text(5));
  d.created_at = st.Text(6);
  d.updated_at = st.Text(7);
  if (!type.has_value() || !status.has_value()) return false;
  d.type = *type;
  d.status = *status;
  out = std::move(d);
  return true;
}

Status SelectById(sqlite3* db, model::DeviceId id, model::Device& out) {
  Statement st(db, std::string("SELECT ") + kColumns + " FROM devices WHERE id = ?;");
  if (!st.Prepared()) return SqliteStore::Classify(db, st.PrepareCode(), "prepare select");
  st.Bind(1, id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE) return NotFound();
  if (rc != SQLITE_ROW) return SqliteStore::Classify(db, rc, "select device");
  if (!ReadDevice(st, out)) {
    return Status::Error(ErrorCode::StorageFailure, "Storage failure",
                         "corrupt device row id=" + std::to_string(id));
  }
  return Status::Ok();
}

}  // namespace

SqliteDeviceRepository::SqliteDeviceRepository(std::shared_ptr<SqliteStore> store,
                                               std::shared_ptr<common::log::Logger> logger)
    : store_(std::move(store)), logger_(std::move(logger)) {
  store_->SetOpenHook(&SqliteDeviceRepository::EnsureSchema);
  if (store_->IsOpen()) {
    const Status st = store_->Run(&SqliteDeviceRepository::EnsureSchema);
    if (!st.IsOk() && logger_) logger_->Warn("schema setup failed: " + st.details);
  }
}

Status SqliteDeviceRepository::EnsureSchema(sqlite3* db) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db, kSchema, nullptr, nullptr, &err_msg);
  if (rc == SQLITE_OK) return Status::Ok();
  const std::string err = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
  sqlite3_free(err_msg);
  return Status::Error(ErrorCode::StorageFailure, "Storage failure", "schema: " + err);
}

Status SqliteDeviceRepository::CheckAvailable() {
  return store_->Ping();
}

Status SqliteDeviceRepository::List(std::vector<model::Device>& out) {
  std::vector<model::Device> devices;
  const Status st = store_->Run([&devices](sqlite3* db) {
    Statement q(db, std::string("SELECT ") + kColumns + " FROM devices ORDER BY name ASC, id ASC;");
    if (!q.Prepared()) return SqliteStore::Classify(db, q.PrepareCode(), "prepare list");

    int rc = SQLITE_OK;
    while ((rc = q.Step()) == SQLITE_ROW) {
      model::Device d;
      if (!ReadDevice(q, d)) {
        return Status::Error(ErrorCode::StorageFailure, "Storage failure", "corrupt device row");
      }
      devices.push_back(std::move(d));
    }
    if (rc != SQLITE_DONE) return SqliteStore::Classify(db, rc, "list devices");
    return Status::Ok();
  });
  if (st.IsOk()) out = std::move(devices);
  return st;
}

Status SqliteDeviceRepository::Create(const model::DeviceInput& input, model::Device& out) {
  model::Device d;
  d.name = input.name;
  d.ip_address = input.ip_address;
  d.type = input.type;
  d.location = input.location;
  d.status = input.status.value_or(model::DeviceStatus::Offline);
  d.created_at = common::time::NowIso8601Utc();
  d.updated_at = d.created_at;

  const Status st = store_->Run([&d](sqlite3* db) {
    Statement q(db,
                "INSERT INTO devices (name, ip_address, type, location, status, created_at, "
                "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!q.Prepared()) return SqliteStore::Classify(db, q.PrepareCode(), "prepare insert");
    q.Bind(1, d.name);
    q.Bind(2, d.ip_address);
    q.Bind(3, model::ToString(d.type));
    q.Bind(4, d.location);
    q.Bind(5, model::ToString(d.status));
    q.Bind(6, d.created_at);
    q.Bind(7, d.updated_at);

    const int rc = q.Step();
    if (rc != SQLITE_DONE) return SqliteStore::Classify(db, rc, "insert device");
    d.id = sqlite3_last_insert_rowid(db);
    return Status::Ok();
  });

  if (st.IsOk()) {
    if (logger_) logger_->Debug("device created id=" + std::to_string(d.id) + " ip=" + d.ip_address);
    out = std::move(d);
  }
  return st;
}

Status SqliteDeviceRepository::Find(std::string_view id, model::Device& out) {
  const auto key = ResolveIdentifier(id);
  // Unresolvable ids still require a reachable store, like any other lookup.
  return store_->Run([&key, &out](sqlite3* db) {
    if (!key.has_value()) return NotFound();
    return SelectById(db, *key, out);
  });
}

Status SqliteDeviceRepository::Update(std::string_view id, const model::DeviceInput& input,
                                      model::Device& out) {
  if (!input.status.has_value()) {
    return Status::Error(ErrorCode::Validation, "Invalid input", "status: field required");
  }
  const auto key = ResolveIdentifier(id);
  const std::string now = common::time::NowIso8601Utc();

  return store_->Run([&](sqlite3* db) {
    if (!key.has_value()) return NotFound();

    Statement q(db,
                "UPDATE devices SET name = ?, ip_address = ?, type = ?, location = ?, "
                "status = ?, updated_at = ? WHERE id = ?;");
    if (!q.Prepared()) return SqliteStore::Classify(db, q.PrepareCode(), "prepare update");
    q.Bind(1, input.name);
    q.Bind(2, input.ip_address);
    q.Bind(3, model::ToString(input.type));
    q.Bind(4, input.location);
    q.Bind(5, model::ToString(*input.status));
    q.Bind(6, now);
    q.Bind(7, *key);

    const int rc = q.Step();
    if (rc != SQLITE_DONE) return SqliteStore::Classify(db, rc, "update device");
    if (sqlite3_changes(db) == 0) return NotFound();
    return SelectById(db, *key, out);
  });
}

Status SqliteDeviceRepository::Delete(std::string_view id) {
  const auto key = ResolveIdentifier(id);
  return store_->Run([&key](sqlite3* db) {
    if (!key.has_value()) return NotFound();

    Statement q(db, "DELETE FROM devices WHERE id = ?;");
    if (!q.Prepared()) return SqliteStore::Classify(db, q.PrepareCode(), "prepare delete");
    q.Bind(1, *key);

    const int rc = q.Step();
    if (rc != SQLITE_DONE) return SqliteStore::Classify(db, rc, "delete device");
    if (sqlite3_changes(db) == 0) return NotFound();
    return Status::Ok();
  });
}

Status SqliteDeviceRepository::UpdateStatus(model::DeviceId id, model::DeviceStatus status) {
  const std::string now = common::time::NowIso8601Utc();
  return store_->Run([&](sqlite3* db) {
    Statement q(db, "UPDATE devices SET status = ?, updated_at = ? WHERE id = ?;");
    if (!q.Prepared()) return SqliteStore::Classify(db, q.PrepareCode(), "prepare status update");
    q.Bind(1, model::ToString(status));
    q.Bind(2, now);
    q.Bind(3, id);

    const int rc = q.Step();
    if (rc != SQLITE_DONE) return SqliteStore::Classify(db, rc, "update status");
    if (sqlite3_changes(db) == 0) return NotFound();
    return Status::Ok();
  });
}

}  // namespace devinv::core::device::storage
