#include "core/device/storage/sqlite_store.hpp"

#include <string>
#include <utility>

namespace devinv::core::device::storage {

using common::error::ErrorCode;
using common::log::Level;

namespace {

constexpr const char* kLogTag = "store";

}  // namespace

SqliteStore::SqliteStore(Options opt, std::shared_ptr<common::log::Logger> logger)
    : opt_(std::move(opt)), logger_(std::move(logger)) {}

SqliteStore::~SqliteStore() {
  Close();
}

void SqliteStore::SetOpenHook(OpenHook hook) {
  std::lock_guard<std::mutex> lock(mu_);
  on_open_ = std::move(hook);
}

Status SqliteStore::Open() {
  std::lock_guard<std::mutex> lock(mu_);
  return OpenLocked();
}

void SqliteStore::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  CloseLocked();
}

bool SqliteStore::IsOpen() const {
  std::lock_guard<std::mutex> lock(mu_);
  return db_ != nullptr;
}

Status SqliteStore::OpenLocked() {
  if (db_ != nullptr) return Status::Ok();

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX |
                    SQLITE_OPEN_URI;
  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(opt_.path.c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string err = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    if (logger_) {
      const std::string msg = "open failed (" + opt_.path + "): " + err;
      if (last_open_failed_) logger_->Log(Level::Debug, kLogTag, msg);
      else logger_->Log(Level::Warn, kLogTag, msg);
    }
    last_open_failed_ = true;
    return Status::Error(ErrorCode::Unavailable, "Database unavailable", err);
  }

  sqlite3_busy_timeout(db, static_cast<int>(opt_.busy_timeout.count()));
  sqlite3_extended_result_codes(db, 1);

  char* err_msg = nullptr;
  if (sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
    const std::string err = err_msg != nullptr ? err_msg : "pragma failed";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    last_open_failed_ = true;
    if (logger_) logger_->Log(Level::Warn, kLogTag, "setup failed: " + err);
    return Status::Error(ErrorCode::Unavailable, "Database unavailable", err);
  }
  // WAL is unavailable for in-memory databases; the default journal is fine there.
  (void)sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

  if (on_open_) {
    Status st = on_open_(db);
    if (!st.IsOk()) {
      sqlite3_close(db);
      last_open_failed_ = true;
      if (logger_) logger_->Log(Level::Warn, kLogTag, "initialization failed: " + st.details);
      if (st.code != ErrorCode::Unavailable) {
        st = Status::Error(ErrorCode::Unavailable, "Database unavailable", st.details);
      }
      return st;
    }
  }

  db_ = db;
  if (logger_) {
    if (last_open_failed_) logger_->Log(Level::Info, kLogTag, "reconnected: " + opt_.path);
    else logger_->Log(Level::Info, kLogTag, "opened: " + opt_.path);
  }
  last_open_failed_ = false;
  return Status::Ok();
}

void SqliteStore::CloseLocked() {
  if (db_ == nullptr) return;
  sqlite3_close_v2(db_);
  db_ = nullptr;
}

Status SqliteStore::Run(const Work& work) {
  std::lock_guard<std::mutex> lock(mu_);
  Status st = OpenLocked();
  if (!st.IsOk()) return st;

  st = work(db_);
  if (st.code == ErrorCode::Unavailable) {
    if (logger_) logger_->Log(Level::Warn, kLogTag, "became unavailable: " + st.details);
    CloseLocked();
  }
  return st;
}

Status SqliteStore::Ping() {
  return Run([](sqlite3* db) {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db, "SELECT 1;", nullptr, nullptr, &err_msg);
    if (rc == SQLITE_OK) return Status::Ok();
    const std::string err = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    return Status::Error(ErrorCode::Unavailable, "Database unavailable", err);
  });
}

Status SqliteStore::Classify(sqlite3* db, int rc, const std::string& what) {
  const std::string err = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  const std::string details = what + ": " + err;

  const int ext = db != nullptr ? sqlite3_extended_errcode(db) : rc;
  if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY ||
      rc == SQLITE_CONSTRAINT_UNIQUE) {
    return Status::Error(ErrorCode::DuplicateKey, "Duplicate key", details);
  }

  switch (rc & 0xff) {
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
    case SQLITE_READONLY:
      return Status::Error(ErrorCode::Unavailable, "Database unavailable", details);
    default:
      return Status::Error(ErrorCode::StorageFailure, "Storage failure", details);
  }
}

}  // namespace devinv::core::device::storage
