#pragma once
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "core/agent/Clock.hpp"
#include "core/codec/RecordCodec.hpp"
#include "core/identity/IdentityResolver.hpp"
#include "core/store/MessageStore.hpp"

namespace mba {

struct RestoreOptions {
  int maxMessagesPerFile = 1000;
};

struct RestoreReport {
  int     filesRestored = 0;
  int     filesFailed = 0;
  int64_t smsInserted = 0;
  int64_t smsSkipped = 0;
  int64_t mmsInserted = 0;
  int64_t mmsSkipped = 0;
  int64_t mmsFailed = 0;
};

// Replays archive chunks into the store. Restore is best effort: duplicates
// already in the store are skipped and a failed message or chunk does not
// stop the pass.
class RestoreEngine {
public:
  RestoreEngine(MessageStore& store, RestoreOptions options, Clock nowMillis);

  // Restores every chunk file in dir, newest file name first. Restored files
  // are deleted; files that fail stay for the next pass.
  RestoreReport restoreDirectory(const std::filesystem::path& dir, IdentityResolver& identity);

  // Restores one chunk file. Throws ArchiveIoError or CodecError on failure.
  void restoreFile(const std::filesystem::path& path, IdentityResolver& identity,
                   RestoreReport& report);

  void restoreSmsEntries(const nlohmann::json& entries, IdentityResolver& identity,
                         RestoreReport& report);
  void restoreMmsEntries(const nlohmann::json& entries, IdentityResolver& identity,
                         RestoreReport& report);

private:
  bool mmsExists(const RestoredMms& mms);
  bool addMmsMessage(const RestoredMms& mms);

  MessageStore& store_;
  RestoreOptions options_;
  Clock nowMillis_;
};

// The SMIL layout written for a restored text-only message.
std::string textOnlySmil(const std::string& textPartName);

} // namespace mba
