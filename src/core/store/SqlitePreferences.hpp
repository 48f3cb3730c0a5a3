#pragma once
#include <optional>
#include <string>

#include "core/store/KeyValueStore.hpp"

namespace mba {

// KeyValueStore backed by the prefs table.
class SqlitePreferences : public KeyValueStore {
public:
  explicit SqlitePreferences(const std::string& dbPath);
  ~SqlitePreferences() override;

  SqlitePreferences(const SqlitePreferences&) = delete;
  SqlitePreferences& operator=(const SqlitePreferences&) = delete;

  bool contains(const std::string& key) override;
  int64_t getLong(const std::string& key, int64_t defval) override;
  void putLongs(const std::vector<std::pair<std::string, int64_t>>& entries) override;
  void remove(const std::vector<std::string>& keys) override;

  // PRAGMA synchronous of this connection; 2 is FULL.
  int synchronousMode();

private:
  std::optional<int64_t> lookup(const std::string& key);

  void* db_; // sqlite3*
};

} // namespace mba
