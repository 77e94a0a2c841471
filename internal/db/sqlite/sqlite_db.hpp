#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace creditgate::db::sqlite {

/*
  Owns the single sqlite3 connection behind the repository.

  Writers are serialized in process by LockWriter() and across processes by
  the busy timeout, so a BEGIN IMMEDIATE from a second creditgate instance
  waits instead of failing with SQLITE_BUSY. The lock is recursive because a
  repository call may run while its caller already holds the transaction.
*/
class SqliteDB {
 public:
  static constexpr std::uint32_t kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(const std::string& path, std::uint32_t busy_timeout_ms = kDefaultBusyTimeoutMs);

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return handle_.get();
  }

  std::unique_lock<std::recursive_mutex> LockWriter() {
    return std::unique_lock<std::recursive_mutex>(writer_mutex_);
  }

  // Runs one or more statements that return no rows the caller needs.
  void Exec(const std::string& sql);

 private:
  struct Closer {
    void operator()(sqlite3* db) const {
      sqlite3_close_v2(db);
    }
  };

  std::unique_ptr<sqlite3, Closer> handle_;
  std::recursive_mutex             writer_mutex_;
};

} // namespace creditgate::db::sqlite
