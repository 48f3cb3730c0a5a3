#include "SqliteMessageStore.hpp"
#include <algorithm>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace mba {

namespace {

constexpr const char* kTextPlain = "text/plain";

// Owns one prepared statement.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw std::runtime_error("prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }
  void bind(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
  }
  template <typename T>
  void bind(int i, const std::optional<T>& v) {
    if (v) bind(i, *v);
    else sqlite3_bind_null(st_, i);
  }

  int step() { return sqlite3_step(st_); }

  // Steps a statement that must not return rows.
  bool run() { return step() == SQLITE_DONE; }

  void reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
  }

  std::optional<int64_t> optInt(int col) const {
    if (sqlite3_column_type(st_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(st_, col);
  }
  int64_t intOr(int col, int64_t defval) const { return optInt(col).value_or(defval); }
  std::optional<std::string> optText(int col) const {
    if (sqlite3_column_type(st_, col) == SQLITE_NULL) return std::nullopt;
    const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
    return std::string(p ? p : "");
  }

  std::string error() const { return sqlite3_errmsg(db_); }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

void execAll(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { execAll(db_, "BEGIN IMMEDIATE;"); }
  ~Transaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() { execAll(db_, "COMMIT;"); done_ = true; }

private:
  sqlite3* db_;
  bool done_ = false;
};

template <typename Row>
class SqliteRowCursor : public RowCursor<Row> {
public:
  using Mapper = std::function<Row(const Statement&)>;

  SqliteRowCursor(sqlite3* db, const char* sql, Mapper map)
    : st_(db, sql), map_(std::move(map)) {}

  std::optional<Row> next() override {
    if (done_) return std::nullopt;
    int rc = st_.step();
    if (rc == SQLITE_ROW) return map_(st_);
    done_ = true;
    if (rc != SQLITE_DONE) throw std::runtime_error("cursor step failed: " + st_.error());
    return std::nullopt;
  }

private:
  Statement st_;
  Mapper map_;
  bool done_ = false;
};

} // namespace

SqliteMessageStore::SqliteMessageStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SqliteMessageStore::~SqliteMessageStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

// -------- backup queries --------

std::unique_ptr<RowCursor<SmsRow>> SqliteMessageStore::querySms() {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT _id, sub_id, address, body, subject, date, date_sent, status, type, thread_id
    FROM sms ORDER BY date ASC
  )SQL";
  return std::make_unique<SqliteRowCursor<SmsRow>>(db, sql, [](const Statement& st) {
    SmsRow r;
    int i = 0;
    r.id        = st.intOr(i++, 0);
    r.sub_id    = st.optInt(i++);
    r.address   = st.optText(i++);
    r.body      = st.optText(i++);
    r.subject   = st.optText(i++);
    r.date      = st.intOr(i++, 0);
    r.date_sent = st.optInt(i++);
    r.status    = st.optInt(i++);
    r.type      = st.optInt(i++);
    r.thread_id = st.optInt(i++);
    return r;
  });
}

std::unique_ptr<RowCursor<MmsRow>> SqliteMessageStore::queryTextOnlyMms() {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT _id, sub_id, sub, sub_cs, date, date_sent, m_type, v, msg_box, ct_l, thread_id
    FROM pdu WHERE text_only = 1 ORDER BY date ASC
  )SQL";
  return std::make_unique<SqliteRowCursor<MmsRow>>(db, sql, [](const Statement& st) {
    MmsRow r;
    int i = 0;
    r.id               = st.intOr(i++, 0);
    r.sub_id           = st.optInt(i++);
    r.subject          = st.optText(i++);
    r.subject_charset  = st.optInt(i++);
    r.date             = st.intOr(i++, 0);
    r.date_sent        = st.optInt(i++);
    r.message_type     = st.optInt(i++);
    r.mms_version      = st.optInt(i++);
    r.message_box      = st.optInt(i++);
    r.content_location = st.optText(i++);
    r.thread_id        = st.optInt(i++);
    return r;
  });
}

std::optional<MmsBody> SqliteMessageStore::mmsBody(int64_t mmsId) {
  Statement st(static_cast<sqlite3*>(db_),
               "SELECT text, chset FROM part WHERE mid = ? AND ct = ? ORDER BY _id ASC");
  st.bind(1, mmsId);
  st.bind(2, std::string(kTextPlain));

  std::optional<MmsBody> body;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    if (!body) body.emplace();
    body->text += st.optText(0).value_or("");
    body->charset = static_cast<int>(st.intOr(1, 0));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("mmsBody failed: " + st.error());
  return body;
}

std::vector<MmsAddress> SqliteMessageStore::mmsAddresses(int64_t mmsId) {
  Statement st(static_cast<sqlite3*>(db_),
               "SELECT type, address, charset FROM addr WHERE msg_id = ? ORDER BY _id ASC");
  st.bind(1, mmsId);

  std::vector<MmsAddress> out;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    MmsAddress a;
    a.type    = static_cast<int>(st.intOr(0, 0));
    a.address = st.optText(1).value_or("");
    a.charset = static_cast<int>(st.intOr(2, 0));
    out.push_back(std::move(a));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("mmsAddresses failed: " + st.error());
  return out;
}

// -------- threads --------

std::optional<std::string> SqliteMessageStore::threadRecipientIds(int64_t threadId) {
  Statement st(static_cast<sqlite3*>(db_), "SELECT recipient_ids FROM threads WHERE _id = ?");
  st.bind(1, threadId);
  int rc = st.step();
  if (rc == SQLITE_ROW) return st.optText(0);
  if (rc != SQLITE_DONE) throw std::runtime_error("threadRecipientIds failed: " + st.error());
  return std::nullopt;
}

std::optional<std::string> SqliteMessageStore::canonicalAddress(int64_t addressId) {
  Statement st(static_cast<sqlite3*>(db_), "SELECT address FROM canonical_addresses WHERE _id = ?");
  st.bind(1, addressId);
  int rc = st.step();
  if (rc == SQLITE_ROW) return st.optText(0);
  if (rc != SQLITE_DONE) throw std::runtime_error("canonicalAddress failed: " + st.error());
  return std::nullopt;
}

int64_t SqliteMessageStore::canonicalAddressId(const std::string& address) {
  auto* db = static_cast<sqlite3*>(db_);
  {
    Statement st(db, "SELECT _id FROM canonical_addresses WHERE address = ?");
    st.bind(1, address);
    if (st.step() == SQLITE_ROW) return st.intOr(0, 0);
  }
  Statement ins(db, "INSERT INTO canonical_addresses (address) VALUES (?)");
  ins.bind(1, address);
  if (!ins.run()) throw std::runtime_error("insert canonical address failed: " + ins.error());
  return sqlite3_last_insert_rowid(db);
}

int64_t SqliteMessageStore::getOrCreateThreadId(const std::set<std::string>& recipients) {
  auto* db = static_cast<sqlite3*>(db_);
  Transaction tx(db);

  std::vector<int64_t> ids;
  ids.reserve(recipients.size());
  for (const auto& r : recipients) ids.push_back(canonicalAddressId(r));
  std::sort(ids.begin(), ids.end());

  std::ostringstream joined;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) joined << ' ';
    joined << ids[i];
  }
  const std::string recipientIds = joined.str();

  int64_t threadId = 0;
  {
    Statement st(db, "SELECT _id FROM threads WHERE recipient_ids = ?");
    st.bind(1, recipientIds);
    if (st.step() == SQLITE_ROW) threadId = st.intOr(0, 0);
  }
  if (threadId == 0) {
    Statement ins(db, "INSERT INTO threads (recipient_ids) VALUES (?)");
    ins.bind(1, recipientIds);
    if (!ins.run()) throw std::runtime_error("insert thread failed: " + ins.error());
    threadId = sqlite3_last_insert_rowid(db);
  }
  tx.commit();
  return threadId;
}

// -------- restore --------

bool SqliteMessageStore::smsExists(int64_t date, const std::optional<std::string>& body) {
  Statement st(static_cast<sqlite3*>(db_),
               "SELECT _id FROM sms WHERE date = ? AND body IS ? LIMIT 1");
  st.bind(1, date);
  st.bind(2, body);
  int rc = st.step();
  if (rc == SQLITE_ROW) return true;
  if (rc != SQLITE_DONE) throw std::runtime_error("smsExists failed: " + st.error());
  return false;
}

std::vector<int64_t> SqliteMessageStore::mmsIdsWithDate(int64_t date) {
  Statement st(static_cast<sqlite3*>(db_), "SELECT _id FROM pdu WHERE date = ?");
  st.bind(1, date);
  std::vector<int64_t> ids;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) ids.push_back(st.intOr(0, 0));
  if (rc != SQLITE_DONE) throw std::runtime_error("mmsIdsWithDate failed: " + st.error());
  return ids;
}

std::size_t SqliteMessageStore::bulkInsertSms(const std::vector<RestoredSms>& batch) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO sms
      (thread_id, address, date, date_sent, read, seen, status, type, subject, body, sub_id)
    VALUES (?,?,?,?,?,?,?,?,?,?,?)
  )SQL";

  Transaction tx(db);
  Statement st(db, sql);
  std::size_t inserted = 0;
  for (const auto& r : batch) {
    int i = 1;
    st.bind(i++, r.thread_id);
    st.bind(i++, r.address);
    st.bind(i++, r.date);
    st.bind(i++, r.date_sent);
    st.bind(i++, static_cast<int64_t>(r.read));
    st.bind(i++, static_cast<int64_t>(r.seen));
    st.bind(i++, r.status);
    st.bind(i++, r.type);
    st.bind(i++, r.subject);
    st.bind(i++, r.body);
    st.bind(i++, r.sub_id);
    if (st.run()) {
      ++inserted;
    } else {
      spdlog::warn("sms insert failed (date={}): {}", r.date.value_or(0), st.error());
    }
    st.reset();
  }
  tx.commit();
  return inserted;
}

std::optional<int64_t> SqliteMessageStore::insertMmsPart(int64_t messageId, const MmsPart& part) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO part (mid, seq, ct, name, chset, cid, cl, text)
    VALUES (?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, messageId);
  st.bind(i++, part.seq);
  st.bind(i++, part.content_type);
  st.bind(i++, part.name);
  st.bind(i++, part.charset);
  st.bind(i++, part.content_id);
  st.bind(i++, part.content_location);
  st.bind(i++, part.text);
  if (!st.run()) {
    spdlog::warn("part insert failed: {}", st.error());
    return std::nullopt;
  }
  return sqlite3_last_insert_rowid(db);
}

std::optional<int64_t> SqliteMessageStore::insertMms(const RestoredMms& mms) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO pdu
      (thread_id, date, date_sent, msg_box, read, seen, sub, sub_cs, ct_l, m_type, v,
       text_only, sub_id)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, mms.thread_id);
  st.bind(i++, mms.date);
  st.bind(i++, mms.date_sent);
  st.bind(i++, mms.message_box);
  st.bind(i++, static_cast<int64_t>(mms.read));
  st.bind(i++, static_cast<int64_t>(mms.seen));
  st.bind(i++, mms.subject);
  st.bind(i++, mms.subject_charset);
  st.bind(i++, mms.content_location);
  st.bind(i++, mms.message_type);
  st.bind(i++, mms.mms_version);
  st.bind(i++, static_cast<int64_t>(mms.text_only));
  st.bind(i++, mms.sub_id);
  if (!st.run()) {
    spdlog::warn("pdu insert failed: {}", st.error());
    return std::nullopt;
  }
  return sqlite3_last_insert_rowid(db);
}

void SqliteMessageStore::updateMmsPartsMessageId(int64_t fromMessageId, int64_t toMessageId) {
  Statement st(static_cast<sqlite3*>(db_), "UPDATE part SET mid = ? WHERE mid = ?");
  st.bind(1, toMessageId);
  st.bind(2, fromMessageId);
  if (!st.run()) throw std::runtime_error("update parts failed: " + st.error());
}

void SqliteMessageStore::deleteMmsParts(int64_t messageId) {
  Statement st(static_cast<sqlite3*>(db_), "DELETE FROM part WHERE mid = ?");
  st.bind(1, messageId);
  if (!st.run()) throw std::runtime_error("delete parts failed: " + st.error());
}

std::optional<int64_t> SqliteMessageStore::insertMmsAddress(int64_t messageId,
                                                            const MmsAddress& addr) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, "INSERT INTO addr (msg_id, address, type, charset) VALUES (?,?,?,?)");
  st.bind(1, messageId);
  st.bind(2, addr.address);
  st.bind(3, static_cast<int64_t>(addr.type));
  st.bind(4, static_cast<int64_t>(addr.charset));
  if (!st.run()) {
    spdlog::warn("addr insert failed: {}", st.error());
    return std::nullopt;
  }
  return sqlite3_last_insert_rowid(db);
}

// -------- lines --------

std::vector<LineRegistration> SqliteMessageStore::activeLineRegistrations() {
  Statement st(static_cast<sqlite3*>(db_),
               "SELECT sub_id, number, country_iso FROM subscriptions WHERE active = 1 "
               "ORDER BY sub_id ASC");
  std::vector<LineRegistration> out;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    LineRegistration l;
    l.sub_id      = st.intOr(0, 0);
    l.number      = st.optText(1).value_or("");
    l.country_iso = st.optText(2).value_or("");
    out.push_back(std::move(l));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("activeLineRegistrations failed: " + st.error());
  return out;
}

// -------- seeding --------

int64_t SqliteMessageStore::insertSmsRow(const SmsRow& r) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO sms (sub_id, address, body, subject, date, date_sent, status, type, thread_id)
    VALUES (?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, r.sub_id);
  st.bind(i++, r.address);
  st.bind(i++, r.body);
  st.bind(i++, r.subject);
  st.bind(i++, r.date);
  st.bind(i++, r.date_sent);
  st.bind(i++, r.status);
  st.bind(i++, r.type);
  st.bind(i++, r.thread_id);
  if (!st.run()) throw std::runtime_error("insertSmsRow failed: " + st.error());
  return sqlite3_last_insert_rowid(db);
}

int64_t SqliteMessageStore::insertMmsRow(const MmsRow& r, bool textOnly) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO pdu (sub_id, sub, sub_cs, date, date_sent, m_type, v, msg_box, ct_l, thread_id,
                     text_only)
    VALUES (?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, r.sub_id);
  st.bind(i++, r.subject);
  st.bind(i++, r.subject_charset);
  st.bind(i++, r.date);
  st.bind(i++, r.date_sent);
  st.bind(i++, r.message_type);
  st.bind(i++, r.mms_version);
  st.bind(i++, r.message_box);
  st.bind(i++, r.content_location);
  st.bind(i++, r.thread_id);
  st.bind(i++, static_cast<int64_t>(textOnly ? 1 : 0));
  if (!st.run()) throw std::runtime_error("insertMmsRow failed: " + st.error());
  return sqlite3_last_insert_rowid(db);
}

void SqliteMessageStore::registerLine(const LineRegistration& line) {
  Statement st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT OR REPLACE INTO subscriptions (sub_id, number, country_iso, active)
    VALUES (?,?,?,1)
  )SQL");
  st.bind(1, line.sub_id);
  st.bind(2, line.number);
  st.bind(3, line.country_iso);
  if (!st.run()) throw std::runtime_error("registerLine failed: " + st.error());
}

} // namespace mba
