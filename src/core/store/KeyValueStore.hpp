#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mba {

// Durable integer preferences. putLongs() commits all entries together.
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;
  virtual bool contains(const std::string& key) = 0;
  virtual int64_t getLong(const std::string& key, int64_t defval) = 0;
  virtual void putLongs(const std::vector<std::pair<std::string, int64_t>>& entries) = 0;
  virtual void remove(const std::vector<std::string>& keys) = 0;
};

} // namespace mba
