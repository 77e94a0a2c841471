#include "sqlite_db.hpp"

#include <stdexcept>

namespace creditgate::db::sqlite {

namespace {

std::string Describe(int rc, sqlite3* db) {
  std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  return message + " (" + sqlite3_errstr(rc) + ")";
}

} // namespace

SqliteDB::SqliteDB(const std::string& path, std::uint32_t busy_timeout_ms) {
  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  handle_.reset(raw);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite open " + path + ": " + Describe(rc, raw));
  }

  const int timeout_ms = static_cast<int>(busy_timeout_ms == 0 ? kDefaultBusyTimeoutMs : busy_timeout_ms);
  if (sqlite3_busy_timeout(raw, timeout_ms) != SQLITE_OK) {
    throw std::runtime_error("sqlite busy_timeout: " + Describe(sqlite3_errcode(raw), raw));
  }

  // Ledger and unlock rows are durable once COMMIT returns; WAL keeps sweep reads off the writer.
  Exec("PRAGMA journal_mode=WAL;"
       "PRAGMA synchronous=FULL;"
       "PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(handle_.get(), sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string message = err ? err : Describe(rc, handle_.get());
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + message);
  }
}

} // namespace creditgate::db::sqlite
