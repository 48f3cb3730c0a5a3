#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/storage/ArchiveTransport.hpp"
#include "core/storage/CompressedFile.hpp"

namespace mba::testing {

// Keeps the inflated text of every chunk handed off.
class RecordingTransport : public ArchiveTransport {
public:
  struct Chunk {
    std::string name;
    std::string json;
  };

  void beginBackup() override { ++begins; chunks.clear(); }

  void handOff(const std::filesystem::path& stagedPath, const std::string& chunkName) override {
    stagedPaths.push_back(stagedPath);
    chunks.push_back({chunkName, inflateFile(stagedPath)});
  }

  std::optional<QuotaExceeded> finishBackup() override {
    ++finishes;
    return exceeded;
  }

  std::vector<std::filesystem::path> retrieve(const std::filesystem::path&) override {
    return {};
  }

  std::vector<Chunk> chunks;
  std::vector<std::filesystem::path> stagedPaths;
  std::optional<QuotaExceeded> exceeded;
  int begins = 0;
  int finishes = 0;
};

} // namespace mba::testing
