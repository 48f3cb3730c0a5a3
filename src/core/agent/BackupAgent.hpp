#pragma once
#include <cstdint>
#include <filesystem>

#include "core/agent/Clock.hpp"
#include "core/backup/ChunkedExporter.hpp"
#include "core/backup/QuotaTracker.hpp"
#include "core/identity/IdentityResolver.hpp"
#include "core/restore/RestoreEngine.hpp"
#include "core/storage/ArchiveTransport.hpp"
#include "core/store/KeyValueStore.hpp"
#include "core/store/MessageStore.hpp"

namespace mba {

struct AgentOptions {
  std::filesystem::path stagingDir;
  std::filesystem::path restoreDir;
  int maxMessagesPerFile = kDefaultMaxMessagesPerFile;
};

// Entry point for the platform callbacks: a backup cycle, a restore cycle
// and the quota notification. Not thread-safe; callers serialize cycles.
class BackupAgent {
public:
  BackupAgent(MessageStore& store, KeyValueStore& prefs, ArchiveTransport& transport,
              AgentOptions options, Clock clock = systemNowMillis);

  BackupReport runBackup();
  RestoreReport runRestore();

  void onQuotaExceeded(int64_t backupDataBytes, int64_t quotaBytes);
  void clearQuotaState();

  const SubscriptionDirectory& directory() const { return directory_; }

private:
  MessageStore& store_;
  ArchiveTransport& transport_;
  AgentOptions options_;
  Clock clock_;
  QuotaTracker quota_;
  SubscriptionDirectory directory_;
};

} // namespace mba
