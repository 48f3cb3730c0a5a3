#include "SqlitePreferences.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <sqlite3.h>

namespace mba {

static void execAll(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

SqlitePreferences::SqlitePreferences(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  sqlite3_busy_timeout(db, 5000);
  // Quota bookkeeping must survive a crash right after a notification.
  try {
    execAll(db, "PRAGMA synchronous=FULL;");
  } catch (const std::runtime_error&) {
    sqlite3_close(db);
    throw;
  }
  db_ = db;
}

int SqlitePreferences::synchronousMode() {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "PRAGMA synchronous;", -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("PRAGMA synchronous failed: ") + sqlite3_errmsg(db));
  }
  const int mode = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : -1;
  sqlite3_finalize(st);
  return mode;
}

SqlitePreferences::~SqlitePreferences() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

std::optional<int64_t> SqlitePreferences::lookup(const std::string& key) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT value FROM prefs WHERE key = ?", -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prefs lookup failed: " + err);
  }
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<int64_t> out;
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    out = sqlite3_column_int64(st, 0);
  } else if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prefs lookup failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

bool SqlitePreferences::contains(const std::string& key) {
  return lookup(key).has_value();
}

int64_t SqlitePreferences::getLong(const std::string& key, int64_t defval) {
  return lookup(key).value_or(defval);
}

void SqlitePreferences::putLongs(const std::vector<std::pair<std::string, int64_t>>& entries) {
  auto* db = static_cast<sqlite3*>(db_);
  execAll(db, "BEGIN IMMEDIATE;");
  sqlite3_stmt* st = nullptr;
  try {
    if (sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO prefs (key, value) VALUES (?, ?)",
                           -1, &st, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("prefs put failed: ") + sqlite3_errmsg(db));
    }
    for (const auto& [key, value] : entries) {
      sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int64(st, 2, value);
      if (sqlite3_step(st) != SQLITE_DONE) {
        throw std::runtime_error(std::string("prefs put failed: ") + sqlite3_errmsg(db));
      }
      sqlite3_reset(st);
    }
    sqlite3_finalize(st);
    st = nullptr;
    execAll(db, "COMMIT;");
  } catch (...) {
    sqlite3_finalize(st);
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SqlitePreferences::remove(const std::vector<std::string>& keys) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM prefs WHERE key = ?", -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prefs remove failed: " + err);
  }
  for (const auto& key : keys) {
    sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(st) != SQLITE_DONE) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st);
      throw std::runtime_error("prefs remove failed: " + err);
    }
    sqlite3_reset(st);
  }
  sqlite3_finalize(st);
}

} // namespace mba
