#include "RecordCodec.hpp"
#include <charconv>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace mba {

using nlohmann::json;
using nlohmann::ordered_json;

namespace {

// -------- value conversion --------

// Strings and numbers are both accepted for scalar fields; null means absent.
std::optional<std::string> textValue(const json& v, const std::string& key) {
  if (v.is_null()) return std::nullopt;
  if (v.is_string()) return v.get<std::string>();
  if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
  if (v.is_number()) return v.dump();
  throw CodecError("'" + key + "' is not a string");
}

std::optional<int64_t> intValue(const json& v, const std::string& key) {
  if (v.is_null()) return std::nullopt;
  if (v.is_number_unsigned() &&
      v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw CodecError("'" + key + "' is out of range");
  }
  if (v.is_number_integer()) return v.get<int64_t>();
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec == std::errc() && ptr == s.data() + s.size() && !s.empty()) return out;
  }
  throw CodecError("'" + key + "' is not an integer");
}

std::set<std::string> recipientSet(const json& v) {
  if (!v.is_array()) throw CodecError("'recipients' is not an array");
  std::set<std::string> out;
  for (const auto& r : v) {
    if (auto s = textValue(r, keys::kRecipients)) out.insert(*s);
  }
  return out;
}

std::vector<MmsAddress> addressList(const json& v) {
  if (!v.is_array()) throw CodecError("'mms_addresses' is not an array");
  std::vector<MmsAddress> out;
  for (const auto& item : v) {
    if (!item.is_object()) throw CodecError("'mms_addresses' entry is not an object");
    MmsAddress addr;
    bool hasAddress = false;
    for (const auto& [name, value] : item.items()) {
      if (name == "type") {
        addr.type = static_cast<int>(intValue(value, name).value_or(0));
      } else if (name == "charset") {
        addr.charset = static_cast<int>(intValue(value, name).value_or(kDefaultCharset));
      } else if (name == "address") {
        auto s = textValue(value, name);
        hasAddress = s.has_value();
        addr.address = s.value_or("");
      } else {
        spdlog::debug("unknown address key '{}'", name);
      }
    }
    if (hasAddress && !addr.address.empty()) out.push_back(std::move(addr));
  }
  return out;
}

// -------- decode tables --------

template <typename Record>
using FieldSetter = void (*)(Record&, const json&, IdentityResolver&);

template <typename Record>
using FieldTable = std::unordered_map<std::string, FieldSetter<Record>>;

void applySelfPhone(int64_t& subId, const json& v, IdentityResolver& identity) {
  auto phone = textValue(v, keys::kSelfPhone);
  if (!phone) return;
  if (auto sub = identity.resolveSubscriptionForPhone(*phone)) subId = *sub;
}

const FieldTable<RestoredSms>& smsFields() {
  static const FieldTable<RestoredSms> table = {
    {"address",   [](RestoredSms& r, const json& v, IdentityResolver&) { r.address = textValue(v, "address"); }},
    {"body",      [](RestoredSms& r, const json& v, IdentityResolver&) { r.body = textValue(v, "body"); }},
    {"subject",   [](RestoredSms& r, const json& v, IdentityResolver&) { r.subject = textValue(v, "subject"); }},
    {"date",      [](RestoredSms& r, const json& v, IdentityResolver&) { r.date = intValue(v, "date"); }},
    {"date_sent", [](RestoredSms& r, const json& v, IdentityResolver&) { r.date_sent = intValue(v, "date_sent"); }},
    {"status",    [](RestoredSms& r, const json& v, IdentityResolver&) { r.status = intValue(v, "status"); }},
    {"type",      [](RestoredSms& r, const json& v, IdentityResolver&) { r.type = intValue(v, "type"); }},
    {keys::kRecipients, [](RestoredSms& r, const json& v, IdentityResolver& id) {
      r.thread_id = id.threadForRecipients(recipientSet(v));
    }},
    {keys::kSelfPhone, [](RestoredSms& r, const json& v, IdentityResolver& id) {
      applySelfPhone(r.sub_id, v, id);
    }},
  };
  return table;
}

// Body text and charset arrive as separate keys in any order.
struct MmsDecodeState {
  RestoredMms mms;
  std::optional<std::string> bodyText;
  int bodyCharset = kDefaultCharset;
};

const FieldTable<MmsDecodeState>& mmsFields() {
  using S = MmsDecodeState;
  static const FieldTable<S> table = {
    {keys::kSelfPhone, [](S& r, const json& v, IdentityResolver& id) {
      applySelfPhone(r.mms.sub_id, v, id);
    }},
    {keys::kMmsAddresses, [](S& r, const json& v, IdentityResolver&) {
      r.mms.addresses = addressList(v);
    }},
    {keys::kMmsBody, [](S& r, const json& v, IdentityResolver&) {
      r.bodyText = textValue(v, keys::kMmsBody);
    }},
    {keys::kMmsCharset, [](S& r, const json& v, IdentityResolver&) {
      if (auto cs = intValue(v, keys::kMmsCharset)) r.bodyCharset = static_cast<int>(*cs);
    }},
    {keys::kRecipients, [](S& r, const json& v, IdentityResolver& id) {
      r.mms.thread_id = id.threadForRecipients(recipientSet(v));
    }},
    {"sub",       [](S& r, const json& v, IdentityResolver&) { r.mms.subject = textValue(v, "sub"); }},
    {"sub_cs",    [](S& r, const json& v, IdentityResolver&) { r.mms.subject_charset = intValue(v, "sub_cs"); }},
    {"date",      [](S& r, const json& v, IdentityResolver&) { r.mms.date = intValue(v, "date"); }},
    {"date_sent", [](S& r, const json& v, IdentityResolver&) { r.mms.date_sent = intValue(v, "date_sent"); }},
    {"m_type",    [](S& r, const json& v, IdentityResolver&) { r.mms.message_type = intValue(v, "m_type"); }},
    {"v",         [](S& r, const json& v, IdentityResolver&) { r.mms.mms_version = intValue(v, "v"); }},
    {"msg_box",   [](S& r, const json& v, IdentityResolver&) {
      if (auto box = intValue(v, "msg_box")) r.mms.message_box = *box;
    }},
    {"ct_l",      [](S& r, const json& v, IdentityResolver&) { r.mms.content_location = textValue(v, "ct_l"); }},
  };
  return table;
}

template <typename Record>
void decodeInto(Record& record, const json& entry, const FieldTable<Record>& table,
                IdentityResolver& identity) {
  if (!entry.is_object()) throw CodecError("archive entry is not an object");
  for (const auto& [name, value] : entry.items()) {
    auto it = table.find(name);
    if (it == table.end()) {
      spdlog::debug("skipping unknown key '{}'", name);
      continue;
    }
    it->second(record, value, identity);
  }
}

} // namespace

// -------- encoder --------

RecordEncoder::RecordEncoder(IdentityResolver& identity, MessageStore& store)
  : identity_(identity), store_(store) {}

void RecordEncoder::putIdentity(ordered_json& out, const std::optional<int64_t>& subId) {
  if (!subId) return;
  if (auto phone = identity_.resolvePhoneForSubscription(*subId)) out[keys::kSelfPhone] = *phone;
}

void RecordEncoder::putRecipients(ordered_json& out, int64_t threadId) {
  ordered_json list = ordered_json::array();
  for (const auto& r : identity_.recipientsForThread(threadId)) list.push_back(r);
  out[keys::kRecipients] = std::move(list);
}

ordered_json RecordEncoder::encodeSms(const SmsRow& row) {
  ordered_json out = ordered_json::object();
  auto put = [&](const char* name, const auto& value) {
    if (value) out[name] = *value;
  };
  auto putNum = [&](const char* name, const std::optional<int64_t>& value) {
    if (value) out[name] = std::to_string(*value);
  };

  putIdentity(out, row.sub_id);
  put("address", row.address);
  put("body", row.body);
  put("subject", row.subject);
  out["date"] = std::to_string(row.date);
  putNum("date_sent", row.date_sent);
  putNum("status", row.status);
  putNum("type", row.type);
  if (row.thread_id) putRecipients(out, *row.thread_id);
  return out;
}

std::optional<ordered_json> RecordEncoder::encodeMms(const MmsRow& row) {
  const auto body = store_.mmsBody(row.id);
  if (!body) return std::nullopt;

  ordered_json out = ordered_json::object();
  auto putNum = [&](const char* name, const std::optional<int64_t>& value) {
    if (value) out[name] = std::to_string(*value);
  };

  putIdentity(out, row.sub_id);
  if (row.subject) out["sub"] = *row.subject;
  out["date"] = std::to_string(row.date);
  putNum("date_sent", row.date_sent);
  putNum("m_type", row.message_type);
  putNum("v", row.mms_version);
  putNum("msg_box", row.message_box);
  if (row.content_location) out["ct_l"] = *row.content_location;
  if (row.thread_id) putRecipients(out, *row.thread_id);

  ordered_json addresses = ordered_json::array();
  for (const auto& a : store_.mmsAddresses(row.id)) {
    if (a.address.empty()) continue;
    ordered_json item = ordered_json::object();
    if (a.type != 0) item["type"] = a.type;
    item["address"] = a.address;
    if (a.charset != 0) item["charset"] = a.charset;
    addresses.push_back(std::move(item));
  }
  out[keys::kMmsAddresses] = std::move(addresses);
  out[keys::kMmsBody] = body->text;
  out[keys::kMmsCharset] = body->charset;

  if (row.subject) putNum("sub_cs", row.subject_charset);
  return out;
}

// -------- decoder --------

RecordDecoder::RecordDecoder(IdentityResolver& identity) : identity_(identity) {}

RestoredSms RecordDecoder::decodeSms(const json& entry) {
  RestoredSms sms;
  decodeInto(sms, entry, smsFields(), identity_);
  return sms;
}

RestoredMms RecordDecoder::decodeMms(const json& entry) {
  MmsDecodeState state;
  decodeInto(state, entry, mmsFields(), identity_);
  RestoredMms mms = std::move(state.mms);
  if (state.bodyText) mms.body = MmsBody{*state.bodyText, state.bodyCharset};
  if (mms.subject && !mms.subject_charset) mms.subject_charset = kDefaultCharset;
  return mms;
}

} // namespace mba
