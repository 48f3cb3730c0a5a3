#pragma once
#include <string>

#include "core/store/MessageStore.hpp"

namespace mba {

// MessageStore over an SQLite database created by initDatabase().
class SqliteMessageStore : public MessageStore {
public:
  explicit SqliteMessageStore(const std::string& dbPath);
  ~SqliteMessageStore() override;

  SqliteMessageStore(const SqliteMessageStore&) = delete;
  SqliteMessageStore& operator=(const SqliteMessageStore&) = delete;

  std::unique_ptr<RowCursor<SmsRow>> querySms() override;
  std::unique_ptr<RowCursor<MmsRow>> queryTextOnlyMms() override;

  std::optional<MmsBody> mmsBody(int64_t mmsId) override;
  std::vector<MmsAddress> mmsAddresses(int64_t mmsId) override;

  std::optional<std::string> threadRecipientIds(int64_t threadId) override;
  std::optional<std::string> canonicalAddress(int64_t addressId) override;
  int64_t getOrCreateThreadId(const std::set<std::string>& recipients) override;

  bool smsExists(int64_t date, const std::optional<std::string>& body) override;
  std::vector<int64_t> mmsIdsWithDate(int64_t date) override;

  std::size_t bulkInsertSms(const std::vector<RestoredSms>& batch) override;
  std::optional<int64_t> insertMmsPart(int64_t messageId, const MmsPart& part) override;
  std::optional<int64_t> insertMms(const RestoredMms& mms) override;
  void updateMmsPartsMessageId(int64_t fromMessageId, int64_t toMessageId) override;
  void deleteMmsParts(int64_t messageId) override;
  std::optional<int64_t> insertMmsAddress(int64_t messageId, const MmsAddress& addr) override;

  std::vector<LineRegistration> activeLineRegistrations() override;

  // Seeding helpers for fixtures and tests.
  int64_t insertSmsRow(const SmsRow& r);
  int64_t insertMmsRow(const MmsRow& r, bool textOnly);
  void registerLine(const LineRegistration& line);

private:
  int64_t canonicalAddressId(const std::string& address);

  void* db_; // sqlite3*
};

} // namespace mba
