#include "LocalFSBackend.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>

#include "core/storage/ChunkName.hpp"
#include "core/storage/CompressedFile.hpp"

namespace mba {

namespace fs = std::filesystem;

static const char* kIncomingDir = ".incoming";

static void removeChunkFiles(const fs::path& dir) {
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    if (!chunkKindOf(entry.path().filename().string())) continue;
    fs::remove(entry.path());
  }
}

LocalFSBackend::LocalFSBackend(std::string root, std::optional<int64_t> quotaBytes)
  : root_(std::move(root)), quotaBytes_(quotaBytes) {
  fs::create_directories(root_);
}

// Chunks of the running cycle collect in .incoming and replace the previous
// set only in finishBackup(), so an aborted cycle leaves the last archive intact.
void LocalFSBackend::beginBackup() {
  bytesThisCycle_ = 0;
  const fs::path incoming = fs::path(root_) / kIncomingDir;
  fs::remove_all(incoming);
  fs::create_directories(incoming);
}

void LocalFSBackend::handOff(const fs::path& stagedPath, const std::string& chunkName) {
  const fs::path incoming = fs::path(root_) / kIncomingDir;
  const fs::path dest = incoming / chunkName;
  const fs::path tmp = incoming / (chunkName + ".part");
  std::error_code ec;
  fs::copy_file(stagedPath, tmp, fs::copy_options::overwrite_existing, ec);
  if (!ec) fs::rename(tmp, dest, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw ArchiveIoError("hand-off of " + chunkName + " failed: " + ec.message());
  }
  const auto size = static_cast<int64_t>(fs::file_size(dest));
  bytesThisCycle_ += size;
  spdlog::debug("archived {} ({} bytes)", chunkName, size);
}

std::optional<QuotaExceeded> LocalFSBackend::finishBackup() {
  const fs::path incoming = fs::path(root_) / kIncomingDir;
  removeChunkFiles(root_);
  if (fs::is_directory(incoming)) {
    for (const auto& entry : fs::directory_iterator(incoming)) {
      fs::rename(entry.path(), fs::path(root_) / entry.path().filename());
    }
    fs::remove_all(incoming);
  }

  if (quotaBytes_ && bytesThisCycle_ > *quotaBytes_) {
    spdlog::warn("archive holds {} bytes, quota is {}", bytesThisCycle_, *quotaBytes_);
    return QuotaExceeded{bytesThisCycle_, *quotaBytes_};
  }
  return std::nullopt;
}

std::vector<fs::path> LocalFSBackend::retrieve(const fs::path& dir) {
  fs::create_directories(dir);
  std::vector<fs::path> out;
  for (const auto& entry : fs::directory_iterator(root_)) {
    if (!entry.is_regular_file()) continue;
    const auto name = entry.path().filename().string();
    if (!chunkKindOf(name)) continue;
    const fs::path dest = dir / name;
    fs::copy_file(entry.path(), dest, fs::copy_options::overwrite_existing);
    out.push_back(dest);
  }
  return out;
}

} // namespace mba
