#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "FakeMessageStore.hpp"
#include "FakeTransport.hpp"
#include "core/agent/BackupAgent.hpp"
#include "core/config/AgentConfig.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/InitDb.hpp"
#include "core/store/SqliteMessageStore.hpp"
#include "core/store/SqlitePreferences.hpp"

using namespace mba;
using mba::testing::FakeMessageStore;
using mba::testing::FakePreferences;
using mba::testing::RecordingTransport;
using mba::testing::TempDir;
using mba::testing::makeMms;
using mba::testing::makeSms;

namespace {

constexpr int64_t kNow = 1700000000000;

std::vector<std::string> filesIn(const std::filesystem::path& dir) {
  std::vector<std::string> out;
  for (const auto& e : std::filesystem::directory_iterator(dir)) {
    if (e.is_regular_file()) out.push_back(e.path().filename().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

TEST(BackupAgent, QuotaNotificationFromTransportIsRecorded) {
  TempDir tmp;
  FakeMessageStore store;
  FakePreferences prefs;
  RecordingTransport transport;
  transport.exceeded = QuotaExceeded{1000, 800};
  store.addSms(makeSms(1, 1000, "a"));

  BackupAgent agent(store, prefs, transport, AgentOptions{tmp.path() / "staging", tmp.path() / "restore", 10},
                    [] { return kNow; });
  agent.runBackup();

  EXPECT_EQ(transport.begins, 1);
  EXPECT_EQ(transport.finishes, 1);
  EXPECT_EQ(prefs.getLong(mba::prefs::kBackupDataBytes, 0), 1000);
  EXPECT_EQ(prefs.getLong(mba::prefs::kQuotaResetTime, 0), kNow + kQuotaResetIntervalMs);
}

TEST(BackupAgent, NextCycleWithholdsAfterQuotaNotification) {
  TempDir tmp;
  FakeMessageStore store;
  FakePreferences prefs;
  RecordingTransport transport;
  for (int i = 0; i < 3; ++i) store.addSms(makeSms(i + 1, 1000LL * (i + 1), "message"));

  BackupAgent agent(store, prefs, transport, AgentOptions{tmp.path() / "staging", tmp.path() / "restore", 1},
                    [] { return kNow; });
  agent.onQuotaExceeded(101, 100);
  const BackupReport report = agent.runBackup();
  EXPECT_EQ(report.chunksWithheld, 1);
  EXPECT_EQ(report.chunksHandedOff, 2);

  agent.clearQuotaState();
  EXPECT_EQ(agent.runBackup().chunksWithheld, 0);
}

TEST(BackupAgent, SelfPhoneComesFromActiveLines) {
  TempDir tmp;
  FakeMessageStore store;
  FakePreferences prefs;
  RecordingTransport transport;
  store.lines = {{3, "201-555-0123", "US"}, {4, "bogus", "US"}};
  SmsRow row = makeSms(1, 1000, "a");
  row.sub_id = 3;
  store.addSms(row);

  BackupAgent agent(store, prefs, transport, AgentOptions{tmp.path() / "staging", tmp.path() / "restore", 10});
  EXPECT_EQ(agent.directory().size(), 1u);
  agent.runBackup();
  ASSERT_EQ(transport.chunks.size(), 1u);
  EXPECT_NE(transport.chunks[0].json.find("\"self_phone\":\"+12015550123\""), std::string::npos);
}

TEST(BackupAgent, BackupAndRestoreThroughLocalArchive) {
  TempDir tmp;
  const std::string sourceDb = (tmp.path() / "source.db").string();
  const std::string targetDb = (tmp.path() / "target.db").string();
  initDatabase(sourceDb, MBA_SCHEMA_PATH);
  initDatabase(targetDb, MBA_SCHEMA_PATH);

  LocalFSBackend archive((tmp.path() / "archive").string());
  {
    SqliteMessageStore store(sourceDb);
    SqlitePreferences prefs(sourceDb);
    store.registerLine({1, "+12015550123", ""});
    const int64_t thread = store.getOrCreateThreadId({"+15550000001"});
    for (int i = 0; i < 5; ++i) {
      SmsRow r = makeSms(0, 1000LL * (i + 1), "sms " + std::to_string(i), thread);
      r.sub_id = 1;
      store.insertSmsRow(r);
    }
    MmsRow m = makeMms(0, 3);
    m.thread_id = thread;
    const int64_t mmsId = store.insertMmsRow(m, true);
    MmsPart body;
    body.content_type = "text/plain";
    body.charset = 106;
    body.text = "mms body";
    store.insertMmsPart(mmsId, body);
    store.insertMmsAddress(mmsId, {137, "+15550000001", 106});

    BackupAgent agent(store, prefs, archive,
                      AgentOptions{tmp.path() / "staging", tmp.path() / "restore-src", 2});
    const BackupReport report = agent.runBackup();
    EXPECT_EQ(report.smsEntries, 5);
    EXPECT_EQ(report.mmsEntries, 1);
  }
  // sms 1,2 | mms 3 | sms 3,4 | sms 5
  EXPECT_EQ(filesIn(tmp.path() / "archive"), (std::vector<std::string>{
    "000000_sms_backup", "000001_mms_backup", "000002_sms_backup", "000003_sms_backup"}));

  SqliteMessageStore target(targetDb);
  SqlitePreferences targetPrefs(targetDb);
  target.registerLine({7, "+12015550123", ""});
  BackupAgent agent(target, targetPrefs, archive,
                    AgentOptions{tmp.path() / "staging", tmp.path() / "restore", 2});

  const RestoreReport first = agent.runRestore();
  EXPECT_EQ(first.filesRestored, 4);
  EXPECT_EQ(first.smsInserted, 5);
  EXPECT_EQ(first.mmsInserted, 1);
  EXPECT_TRUE(filesIn(tmp.path() / "restore").empty());
  EXPECT_TRUE(target.smsExists(3000, std::string("sms 2")));

  auto cursor = target.querySms();
  auto restored = cursor->next();
  ASSERT_TRUE(restored);
  EXPECT_EQ(restored->sub_id, 7);
  ASSERT_TRUE(restored->thread_id);
  const auto ids = target.threadRecipientIds(*restored->thread_id);
  ASSERT_TRUE(ids);
  EXPECT_EQ(target.canonicalAddress(std::stoll(*ids)), "+15550000001");

  const auto mmsIds = target.mmsIdsWithDate(3);
  ASSERT_EQ(mmsIds.size(), 1u);
  EXPECT_EQ(target.mmsBody(mmsIds[0]), (MmsBody{"mms body", 106}));
  ASSERT_EQ(target.mmsAddresses(mmsIds[0]).size(), 1u);

  const RestoreReport second = agent.runRestore();
  EXPECT_EQ(second.smsInserted, 0);
  EXPECT_EQ(second.smsSkipped, 5);
  EXPECT_EQ(second.mmsSkipped, 1);
}

TEST(LocalFSBackend, NewBackupReplacesPreviousSet) {
  TempDir tmp;
  LocalFSBackend archive((tmp.path() / "cold").string(), 10);
  const auto staged = tmp.path() / "staged";
  {
    std::ofstream out(staged, std::ios::binary);
    out << "0123456789ABCDEF";
  }

  archive.beginBackup();
  archive.handOff(staged, "000000_sms_backup");
  archive.handOff(staged, "000001_sms_backup");
  const auto exceeded = archive.finishBackup();
  ASSERT_TRUE(exceeded);
  EXPECT_EQ(exceeded->backup_data_bytes, 32);
  EXPECT_EQ(exceeded->quota_bytes, 10);
  EXPECT_TRUE(std::filesystem::exists(staged));

  archive.beginBackup();
  archive.handOff(staged, "000000_mms_backup");
  EXPECT_EQ(filesIn(tmp.path() / "cold"),
            (std::vector<std::string>{"000000_sms_backup", "000001_sms_backup"}));
  archive.finishBackup();
  EXPECT_EQ(filesIn(tmp.path() / "cold"), std::vector<std::string>{"000000_mms_backup"});

  const auto copies = archive.retrieve(tmp.path() / "restore");
  ASSERT_EQ(copies.size(), 1u);
  EXPECT_TRUE(std::filesystem::exists(tmp.path() / "restore" / "000000_mms_backup"));
}

TEST(AgentConfig, ReadsEnvironmentWithFallbacks) {
  setenv("MBA_DB_PATH", "/tmp/x.db", 1);
  setenv("MBA_MAX_MSG_PER_FILE", "250", 1);
  setenv("MBA_PORT", "not-a-port", 1);
  setenv("MBA_ARCHIVE_QUOTA_BYTES", "4096", 1);
  unsetenv("MBA_RESTORE_DIR");

  const AgentConfig cfg = loadConfigFromEnv();
  EXPECT_EQ(cfg.dbPath, "/tmp/x.db");
  EXPECT_EQ(cfg.maxMessagesPerFile, 250);
  EXPECT_EQ(cfg.port, 8080);
  EXPECT_EQ(cfg.archiveQuotaBytes, 4096);
  EXPECT_EQ(cfg.restoreDir, "data/restore");

  unsetenv("MBA_DB_PATH");
  unsetenv("MBA_MAX_MSG_PER_FILE");
  unsetenv("MBA_PORT");
  unsetenv("MBA_ARCHIVE_QUOTA_BYTES");
}
