#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include "core/common/error/status.hpp"
#include "core/common/logger/logger.hpp"

namespace devinv::core::device::storage {

using common::error::Status;

// Long-lived handle to one SQLite database. The connection is opened on first
// use and reopened after a failure that left the store unreachable; all access
// is serialized through Run().
class SqliteStore {
public:
  struct Options {
    std::string path = ":memory:";
    std::chrono::milliseconds busy_timeout{1000};
  };

  // Called with the fresh connection after every successful open.
  using OpenHook = std::function<Status(sqlite3* db)>;
  using Work = std::function<Status(sqlite3* db)>;

  explicit SqliteStore(Options opt, std::shared_ptr<common::log::Logger> logger = nullptr);
  ~SqliteStore();

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  void SetOpenHook(OpenHook hook);

  Status Open();
  void Close();
  bool IsOpen() const;

  // Opens lazily, then runs `work` holding the connection lock. A result of
  // Unavailable closes the connection so the next call reconnects.
  Status Run(const Work& work);

  Status Ping();

  const Options& GetOptions() const { return opt_; }

  // Maps a failed sqlite result code to Unavailable, DuplicateKey or
  // StorageFailure.
  static Status Classify(sqlite3* db, int rc, const std::string& what);

private:
  Status OpenLocked();
  void CloseLocked();

private:
  Options opt_;
  std::shared_ptr<common::log::Logger> logger_;
  OpenHook on_open_;

  mutable std::mutex mu_;
  sqlite3* db_ = nullptr;
  bool last_open_failed_ = false;
};

}  // namespace devinv::core::device::storage
