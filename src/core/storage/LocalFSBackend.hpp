#pragma once
#include <optional>
#include <string>

#include "core/storage/ArchiveTransport.hpp"

namespace mba {

// Directory-backed archive. Staged chunks are copied into root; a new backup
// replaces the previous set.
class LocalFSBackend : public ArchiveTransport {
public:
  explicit LocalFSBackend(std::string root,
                          std::optional<int64_t> quotaBytes = std::nullopt);

  void beginBackup() override;
  void handOff(const std::filesystem::path& stagedPath, const std::string& chunkName) override;
  std::optional<QuotaExceeded> finishBackup() override;

  std::vector<std::filesystem::path> retrieve(const std::filesystem::path& dir) override;

private:
  std::string root_;
  std::optional<int64_t> quotaBytes_;
  int64_t bytesThisCycle_ = 0; // handed off since beginBackup()
};

} // namespace mba
