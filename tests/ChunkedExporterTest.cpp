#include <gtest/gtest.h>

#include "FakeMessageStore.hpp"
#include "FakeTransport.hpp"
#include "core/backup/ChunkedExporter.hpp"

using namespace mba;
using mba::testing::FakeMessageStore;
using mba::testing::FakePreferences;
using mba::testing::RecordingTransport;
using mba::testing::TempDir;
using mba::testing::makeMms;
using mba::testing::makeSms;
using nlohmann::json;

namespace {

class ChunkedExporterTest : public ::testing::Test {
protected:
  BackupReport run(int maxPerFile = kDefaultMaxMessagesPerFile) {
    QuotaTracker quota(prefs);
    quota.beginCycle(0);
    IdentityResolver identity(directory, store);
    ChunkedExporter exporter(store, transport, quota,
                             ExportOptions{tmp.path() / "staging", maxPerFile});
    return exporter.run(identity);
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& c : transport.chunks) out.push_back(c.name);
    return out;
  }

  TempDir tmp;
  FakeMessageStore store;
  FakePreferences prefs;
  RecordingTransport transport;
  SubscriptionDirectory directory;
};

} // namespace

TEST_F(ChunkedExporterTest, EmptyStoreProducesNoChunks) {
  const BackupReport report = run();
  EXPECT_TRUE(report.chunks.empty());
  EXPECT_TRUE(transport.chunks.empty());
}

TEST_F(ChunkedExporterTest, SplitsAtMaxMessagesPerFile) {
  for (int i = 0; i < 1001; ++i) store.addSms(makeSms(i + 1, 1000LL * (i + 1), "m" + std::to_string(i)));

  const BackupReport report = run();
  ASSERT_EQ(transport.chunks.size(), 2u);
  EXPECT_EQ(names(), (std::vector<std::string>{"000000_sms_backup", "000001_sms_backup"}));
  EXPECT_EQ(json::parse(transport.chunks[0].json).size(), 1000u);
  EXPECT_EQ(json::parse(transport.chunks[1].json).size(), 1u);
  EXPECT_EQ(report.smsEntries, 1001);
  EXPECT_EQ(report.chunksHandedOff, 2);
}

TEST_F(ChunkedExporterTest, ChunkHoldsAJsonArrayOfEntries) {
  store.addSms(makeSms(1, 5000, "first"));
  store.addSms(makeSms(2, 6000, "second"));

  run();
  ASSERT_EQ(transport.chunks.size(), 1u);
  const json entries = json::parse(transport.chunks[0].json);
  ASSERT_TRUE(entries.is_array());
  EXPECT_EQ(entries[0]["body"], "first");
  EXPECT_EQ(entries[1]["date"], "6000");
}

TEST_F(ChunkedExporterTest, MergesStreamsOldestFirst) {
  // sms dates in ms, mms dates in s
  store.addSms(makeSms(1, 1000, "a"));     // t=1
  store.addSms(makeSms(2, 5000, "c"));     // t=5
  store.addSms(makeSms(3, 9000, "e"));     // t=9
  store.addMms(makeMms(10, 3), MmsBody{"b", 106});
  store.addMms(makeMms(11, 7), MmsBody{"d", 106});

  run(1);
  EXPECT_EQ(names(), (std::vector<std::string>{
    "000000_sms_backup", "000001_mms_backup", "000002_sms_backup",
    "000003_mms_backup", "000004_sms_backup"}));
}

TEST_F(ChunkedExporterTest, EqualSecondsGoToMmsFirst) {
  store.addSms(makeSms(1, 3500, "sms"));
  store.addMms(makeMms(10, 3), MmsBody{"mms", 106});

  run(1);
  EXPECT_EQ(names(), (std::vector<std::string>{"000000_mms_backup", "000001_sms_backup"}));
}

TEST_F(ChunkedExporterTest, ChunkTakesConsecutiveRowsOfOneKind) {
  store.addSms(makeSms(1, 1000, "a"));
  store.addSms(makeSms(2, 2000, "b"));
  store.addSms(makeSms(3, 3000, "c"));
  store.addMms(makeMms(10, 2), MmsBody{"m", 106});

  run(10);
  // once the sms chunk starts it fills from the sms stream only
  ASSERT_EQ(names(), (std::vector<std::string>{"000000_sms_backup", "000001_mms_backup"}));
  EXPECT_EQ(json::parse(transport.chunks[0].json).size(), 3u);
}

TEST_F(ChunkedExporterTest, MmsWithoutBodyIsSkippedWithoutSplitting) {
  store.addMms(makeMms(10, 1), MmsBody{"one", 106});
  store.addMms(makeMms(11, 2), std::nullopt);
  store.addMms(makeMms(12, 3), MmsBody{"two", 106});

  const BackupReport report = run(2);
  ASSERT_EQ(transport.chunks.size(), 1u);
  const json entries = json::parse(transport.chunks[0].json);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["mms_body"], "one");
  EXPECT_EQ(entries[1]["mms_body"], "two");
  EXPECT_EQ(report.mmsEntries, 2);
}

TEST_F(ChunkedExporterTest, EmptyChunkIsDiscardedButUsesASequenceNumber) {
  store.addMms(makeMms(10, 1), std::nullopt);
  store.addSms(makeSms(1, 2000, "after"));

  const BackupReport report = run();
  ASSERT_EQ(report.chunks.size(), 2u);
  EXPECT_EQ(report.chunks[0].fate, ChunkRecord::Fate::Empty);
  EXPECT_EQ(report.chunksEmpty, 1);
  EXPECT_EQ(names(), std::vector<std::string>{"000001_sms_backup"});
}

TEST_F(ChunkedExporterTest, StagedFilesAreRemoved) {
  store.addSms(makeSms(1, 1000, "a"));
  store.addSms(makeSms(2, 2000, "b"));
  store.addMms(makeMms(10, 1), std::nullopt);

  run(1);
  ASSERT_FALSE(transport.stagedPaths.empty());
  for (const auto& p : transport.stagedPaths) EXPECT_FALSE(std::filesystem::exists(p));
  EXPECT_TRUE(std::filesystem::is_empty(tmp.path() / "staging"));
}

TEST_F(ChunkedExporterTest, QuotaWithholdsOldestChunks) {
  for (int i = 0; i < 6; ++i) store.addSms(makeSms(i + 1, 1000LL * (i + 1), "body " + std::to_string(i)));

  // Learn the chunk sizes from an unrestricted pass.
  const BackupReport full = run(1);
  ASSERT_EQ(full.chunks.size(), 6u);
  // Overage of exactly the first chunk; the 10% inflation spills into the second.
  const int64_t data = 100000;
  prefs.putLongs({{mba::prefs::kBackupDataBytes, data},
                  {mba::prefs::kQuotaBytes, data - full.chunks[0].bytes},
                  {mba::prefs::kQuotaResetTime, 1}});

  transport.chunks.clear();
  const BackupReport report = run(1);
  EXPECT_EQ(report.chunksWithheld, 2);
  EXPECT_EQ(report.chunks[0].fate, ChunkRecord::Fate::Withheld);
  EXPECT_EQ(report.chunks[1].fate, ChunkRecord::Fate::Withheld);
  EXPECT_EQ(report.chunks[2].fate, ChunkRecord::Fate::HandedOff);
  EXPECT_EQ(names(), (std::vector<std::string>{
    "000002_sms_backup", "000003_sms_backup", "000004_sms_backup", "000005_sms_backup"}));
}
