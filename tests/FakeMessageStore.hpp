#pragma once
#include <algorithm>
#include <filesystem>
#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/store/KeyValueStore.hpp"
#include "core/store/MessageStore.hpp"

namespace mba::testing {

template <typename Row>
class VectorCursor : public RowCursor<Row> {
public:
  explicit VectorCursor(std::vector<Row> rows) : rows_(std::move(rows)) {}
  std::optional<Row> next() override {
    if (pos_ >= rows_.size()) return std::nullopt;
    return rows_[pos_++];
  }

private:
  std::vector<Row> rows_;
  size_t pos_ = 0;
};

// In-memory MessageStore with call counters and failure switches.
class FakeMessageStore : public MessageStore {
public:
  struct StoredPart {
    int64_t id;
    int64_t mid;
    MmsPart part;
  };

  // -------- seeding --------

  void addSms(SmsRow row) { sms.push_back(std::move(row)); }

  // A text-only message with a text/plain body part, or none if body is nullopt.
  void addMms(MmsRow row, std::optional<MmsBody> body,
              std::vector<MmsAddress> addrs = {}) {
    if (body) {
      MmsPart p;
      p.content_type = "text/plain";
      p.charset = body->charset;
      p.text = body->text;
      parts.push_back({nextPartId_++, row.id, p});
    }
    for (auto& a : addrs) addresses.emplace_back(row.id, std::move(a));
    mms.push_back(std::move(row));
  }

  void addThread(int64_t threadId, const std::string& recipientIds) {
    threads[threadId] = recipientIds;
  }
  void addCanonical(int64_t id, const std::string& address) { canonical[id] = address; }

  // -------- MessageStore --------

  std::unique_ptr<RowCursor<SmsRow>> querySms() override {
    auto rows = sms;
    std::stable_sort(rows.begin(), rows.end(),
                     [](const SmsRow& a, const SmsRow& b) { return a.date < b.date; });
    return std::make_unique<VectorCursor<SmsRow>>(std::move(rows));
  }

  std::unique_ptr<RowCursor<MmsRow>> queryTextOnlyMms() override {
    auto rows = mms;
    std::stable_sort(rows.begin(), rows.end(),
                     [](const MmsRow& a, const MmsRow& b) { return a.date < b.date; });
    return std::make_unique<VectorCursor<MmsRow>>(std::move(rows));
  }

  std::optional<MmsBody> mmsBody(int64_t mmsId) override {
    ++mmsBodyCalls;
    std::optional<MmsBody> body;
    for (const auto& p : parts) {
      if (p.mid != mmsId || p.part.content_type != "text/plain") continue;
      if (!body) body.emplace();
      body->text += p.part.text;
      body->charset = static_cast<int>(p.part.charset.value_or(0));
    }
    return body;
  }

  std::vector<MmsAddress> mmsAddresses(int64_t mmsId) override {
    std::vector<MmsAddress> out;
    for (const auto& [id, a] : addresses) {
      if (id == mmsId) out.push_back(a);
    }
    return out;
  }

  std::optional<std::string> threadRecipientIds(int64_t threadId) override {
    ++threadLookups;
    auto it = threads.find(threadId);
    if (it == threads.end()) return std::nullopt;
    return it->second;
  }

  std::optional<std::string> canonicalAddress(int64_t addressId) override {
    ++canonicalLookups;
    if (failingCanonicalIds.count(addressId)) throw std::runtime_error("lookup failed");
    auto it = canonical.find(addressId);
    if (it == canonical.end()) return std::nullopt;
    return it->second;
  }

  int64_t getOrCreateThreadId(const std::set<std::string>& recipients) override {
    ++threadCreateCalls;
    std::vector<int64_t> ids;
    for (const auto& r : recipients) {
      int64_t found = 0;
      for (const auto& [id, addr] : canonical) {
        if (addr == r) { found = id; break; }
      }
      if (found == 0) {
        found = canonical.empty() ? 1 : canonical.rbegin()->first + 1;
        canonical[found] = r;
      }
      ids.push_back(found);
    }
    std::sort(ids.begin(), ids.end());
    std::string joined;
    for (size_t i = 0; i < ids.size(); ++i) {
      if (i) joined += ' ';
      joined += std::to_string(ids[i]);
    }
    for (const auto& [id, value] : threads) {
      if (value == joined) return id;
    }
    const int64_t id = threads.empty() ? 1 : threads.rbegin()->first + 1;
    threads[id] = joined;
    return id;
  }

  bool smsExists(int64_t date, const std::optional<std::string>& body) override {
    for (const auto& r : sms) {
      if (r.date == date && r.body == body) return true;
    }
    for (const auto& r : insertedSms) {
      if (r.date == date && r.body == body) return true;
    }
    return false;
  }

  std::vector<int64_t> mmsIdsWithDate(int64_t date) override {
    std::vector<int64_t> ids;
    for (const auto& r : mms) {
      if (r.date == date) ids.push_back(r.id);
    }
    for (const auto& [id, r] : insertedMms) {
      if (r.date == date) ids.push_back(id);
    }
    return ids;
  }

  std::size_t bulkInsertSms(const std::vector<RestoredSms>& batch) override {
    ++bulkInsertCalls;
    std::size_t n = 0;
    for (const auto& r : batch) {
      if (!r.date || failSmsBodies.count(r.body.value_or(""))) continue;
      insertedSms.push_back(r);
      ++n;
    }
    return n;
  }

  std::optional<int64_t> insertMmsPart(int64_t messageId, const MmsPart& part) override {
    if (failPartInsert) return std::nullopt;
    parts.push_back({nextPartId_, messageId, part});
    return nextPartId_++;
  }

  std::optional<int64_t> insertMms(const RestoredMms& m) override {
    if (!m.date || (m.body && failMmsBodies.count(m.body->text))) return std::nullopt;
    const int64_t id = nextMmsId_++;
    insertedMms.emplace_back(id, m);
    return id;
  }

  void updateMmsPartsMessageId(int64_t fromMessageId, int64_t toMessageId) override {
    for (auto& p : parts) {
      if (p.mid == fromMessageId) p.mid = toMessageId;
    }
  }

  void deleteMmsParts(int64_t messageId) override {
    parts.erase(std::remove_if(parts.begin(), parts.end(),
                               [&](const StoredPart& p) { return p.mid == messageId; }),
                parts.end());
  }

  std::optional<int64_t> insertMmsAddress(int64_t messageId, const MmsAddress& addr) override {
    addresses.emplace_back(messageId, addr);
    return static_cast<int64_t>(addresses.size());
  }

  std::vector<LineRegistration> activeLineRegistrations() override { return lines; }

  // -------- state --------

  std::vector<SmsRow> sms;
  std::vector<MmsRow> mms;
  std::vector<StoredPart> parts;
  std::vector<std::pair<int64_t, MmsAddress>> addresses;
  std::map<int64_t, std::string> threads;
  std::map<int64_t, std::string> canonical;
  std::vector<LineRegistration> lines;

  std::vector<RestoredSms> insertedSms;
  std::vector<std::pair<int64_t, RestoredMms>> insertedMms;

  std::set<int64_t> failingCanonicalIds;
  std::set<std::string> failSmsBodies;
  std::set<std::string> failMmsBodies;
  bool failPartInsert = false;

  int threadLookups = 0;
  int canonicalLookups = 0;
  int threadCreateCalls = 0;
  int mmsBodyCalls = 0;
  int bulkInsertCalls = 0;

private:
  int64_t nextPartId_ = 1;
  int64_t nextMmsId_ = 1000;
};

class FakePreferences : public KeyValueStore {
public:
  bool contains(const std::string& key) override { return values.count(key) > 0; }
  int64_t getLong(const std::string& key, int64_t defval) override {
    auto it = values.find(key);
    return it == values.end() ? defval : it->second;
  }
  void putLongs(const std::vector<std::pair<std::string, int64_t>>& entries) override {
    for (const auto& [k, v] : entries) values[k] = v;
  }
  void remove(const std::vector<std::string>& keys) override {
    for (const auto& k : keys) values.erase(k);
  }

  std::map<std::string, int64_t> values;
};

// Unique scratch directory removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("mba_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline SmsRow makeSms(int64_t id, int64_t dateMs, std::string body,
                      std::optional<int64_t> threadId = std::nullopt) {
  SmsRow r;
  r.id = id;
  r.date = dateMs;
  r.body = std::move(body);
  r.address = "+15550000000";
  r.type = 1;
  r.thread_id = threadId;
  return r;
}

inline MmsRow makeMms(int64_t id, int64_t dateSec) {
  MmsRow r;
  r.id = id;
  r.date = dateSec;
  r.message_box = 1;
  return r;
}

} // namespace mba::testing
