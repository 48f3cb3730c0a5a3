#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/store/Records.hpp"

namespace mba {

// Forward-only sequence of rows. next() returns std::nullopt once exhausted.
template <typename Row>
class RowCursor {
public:
  virtual ~RowCursor() = default;
  virtual std::optional<Row> next() = 0;
};

// Record store consumed by the exporter, the identity resolver and the
// restore engine. Query failures throw; inserts report failure by returning
// std::nullopt so a single message can be abandoned without aborting a pass.
class MessageStore {
public:
  virtual ~MessageStore() = default;

  // sms rows ordered by date ascending.
  virtual std::unique_ptr<RowCursor<SmsRow>> querySms() = 0;
  // Text-only pdu rows ordered by date ascending.
  virtual std::unique_ptr<RowCursor<MmsRow>> queryTextOnlyMms() = 0;

  // Concatenated text/plain parts of a message, or nullopt if it has none.
  virtual std::optional<MmsBody> mmsBody(int64_t mmsId) = 0;
  // Address rows of a message ordered by id. Null addresses come back empty.
  virtual std::vector<MmsAddress> mmsAddresses(int64_t mmsId) = 0;

  // Space separated canonical address ids of a thread, nullopt if unknown.
  virtual std::optional<std::string> threadRecipientIds(int64_t threadId) = 0;
  virtual std::optional<std::string> canonicalAddress(int64_t addressId) = 0;
  virtual int64_t getOrCreateThreadId(const std::set<std::string>& recipients) = 0;

  virtual bool smsExists(int64_t date, const std::optional<std::string>& body) = 0;
  virtual std::vector<int64_t> mmsIdsWithDate(int64_t date) = 0;

  virtual std::size_t bulkInsertSms(const std::vector<RestoredSms>& batch) = 0;
  virtual std::optional<int64_t> insertMmsPart(int64_t messageId, const MmsPart& part) = 0;
  virtual std::optional<int64_t> insertMms(const RestoredMms& mms) = 0;
  virtual void updateMmsPartsMessageId(int64_t fromMessageId, int64_t toMessageId) = 0;
  virtual void deleteMmsParts(int64_t messageId) = 0;
  virtual std::optional<int64_t> insertMmsAddress(int64_t messageId, const MmsAddress& addr) = 0;

  virtual std::vector<LineRegistration> activeLineRegistrations() = 0;
};

} // namespace mba
