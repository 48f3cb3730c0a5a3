#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mba {

// What the destination reports when a cycle did not fit.
struct QuotaExceeded {
  int64_t backup_data_bytes = 0;
  int64_t quota_bytes = 0;
};

// Backup destination. A backup cycle is beginBackup(), any number of
// handOff() calls, then finishBackup().
class ArchiveTransport {
public:
  virtual ~ArchiveTransport() = default;

  virtual void beginBackup() = 0;
  // Copies a finished chunk into the archive. The caller still owns stagedPath.
  virtual void handOff(const std::filesystem::path& stagedPath, const std::string& chunkName) = 0;
  virtual std::optional<QuotaExceeded> finishBackup() = 0;

  // Copies every archived chunk into dir for a restore pass; returns the copies.
  virtual std::vector<std::filesystem::path> retrieve(const std::filesystem::path& dir) = 0;
};

} // namespace mba
