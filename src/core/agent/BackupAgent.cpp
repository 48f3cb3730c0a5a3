#include "BackupAgent.hpp"
#include <spdlog/spdlog.h>

namespace mba {

BackupAgent::BackupAgent(MessageStore& store, KeyValueStore& prefs, ArchiveTransport& transport,
                         AgentOptions options, Clock clock)
  : store_(store), transport_(transport), options_(std::move(options)),
    clock_(std::move(clock)), quota_(prefs),
    directory_(SubscriptionDirectory::fromRegistrations(store.activeLineRegistrations())) {
  spdlog::debug("{} active line(s) resolved", directory_.size());
}

BackupReport BackupAgent::runBackup() {
  spdlog::info("backup cycle starting");
  transport_.beginBackup();
  quota_.beginCycle(clock_());

  IdentityResolver identity(directory_, store_);
  ChunkedExporter exporter(store_, transport_, quota_,
                           ExportOptions{options_.stagingDir, options_.maxMessagesPerFile});
  BackupReport report = exporter.run(identity);

  if (auto exceeded = transport_.finishBackup()) {
    onQuotaExceeded(exceeded->backup_data_bytes, exceeded->quota_bytes);
  }
  return report;
}

RestoreReport BackupAgent::runRestore() {
  spdlog::info("restore cycle starting");
  const auto files = transport_.retrieve(options_.restoreDir);
  spdlog::debug("retrieved {} chunk file(s) into {}", files.size(), options_.restoreDir.string());

  IdentityResolver identity(directory_, store_);
  RestoreEngine engine(store_, RestoreOptions{options_.maxMessagesPerFile}, clock_);
  return engine.restoreDirectory(options_.restoreDir, identity);
}

void BackupAgent::onQuotaExceeded(int64_t backupDataBytes, int64_t quotaBytes) {
  quota_.onQuotaExceeded(backupDataBytes, quotaBytes, clock_());
}

void BackupAgent::clearQuotaState() {
  quota_.clear();
}

} // namespace mba
