#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mba {

// Sentinel for "no subscription" on restored rows.
constexpr int kUnknownSubscription = -1;

// MMS character set used when an archive entry does not carry one (UTF-8).
constexpr int kDefaultCharset = 106;

// msg_box value meaning "all boxes".
constexpr int kMessageBoxAll = 0;

// One row of the sms table, columns in store order.
struct SmsRow {
  int64_t                    id = 0;
  std::optional<int64_t>     sub_id;
  std::optional<std::string> address;
  std::optional<std::string> body;
  std::optional<std::string> subject;
  int64_t                    date = 0;       // ms since epoch
  std::optional<int64_t>     date_sent;      // ms since epoch
  std::optional<int64_t>     status;
  std::optional<int64_t>     type;
  std::optional<int64_t>     thread_id;
};

// One row of the pdu table restricted to text-only messages.
struct MmsRow {
  int64_t                    id = 0;
  std::optional<int64_t>     sub_id;
  std::optional<std::string> subject;
  std::optional<int64_t>     subject_charset;
  int64_t                    date = 0;       // seconds since epoch
  std::optional<int64_t>     date_sent;      // seconds since epoch
  std::optional<int64_t>     message_type;
  std::optional<int64_t>     mms_version;
  std::optional<int64_t>     message_box;
  std::optional<std::string> content_location;
  std::optional<int64_t>     thread_id;
};

struct MmsAddress {
  int         type = 0;
  std::string address;
  int         charset = kDefaultCharset;

  bool operator==(const MmsAddress& o) const {
    return type == o.type && address == o.address && charset == o.charset;
  }
};

struct MmsBody {
  std::string text;
  int         charset = 0;

  bool operator==(const MmsBody& o) const {
    return text == o.text && charset == o.charset;
  }
  bool operator!=(const MmsBody& o) const { return !(*this == o); }
};

// A row of the part sub-resource as written on restore.
struct MmsPart {
  int64_t                    seq = 0;
  std::string                content_type;
  std::string                name;
  std::string                content_id;
  std::string                content_location;
  std::optional<int64_t>     charset;
  std::string                text;
};

// Decoded SMS ready for insertion.
struct RestoredSms {
  int64_t                    sub_id = kUnknownSubscription;
  int                        read = 1;
  int                        seen = 1;
  std::optional<std::string> address;
  std::optional<std::string> body;
  std::optional<std::string> subject;
  std::optional<int64_t>     date;
  std::optional<int64_t>     date_sent;
  std::optional<int64_t>     status;
  std::optional<int64_t>     type;
  std::optional<int64_t>     thread_id;
};

// Decoded MMS: main record fields plus side data written through the part
// and addr sub-resources.
struct RestoredMms {
  int64_t                    sub_id = kUnknownSubscription;
  int                        read = 1;
  int                        seen = 1;
  int                        text_only = 1;
  int64_t                    message_box = kMessageBoxAll;
  std::optional<std::string> subject;
  std::optional<int64_t>     subject_charset;
  std::optional<int64_t>     date;
  std::optional<int64_t>     date_sent;
  std::optional<int64_t>     message_type;
  std::optional<int64_t>     mms_version;
  std::optional<std::string> content_location;
  std::optional<int64_t>     thread_id;

  std::vector<MmsAddress>    addresses;
  std::optional<MmsBody>     body;
};

// An active line as registered with the device.
struct LineRegistration {
  int64_t     sub_id = 0;
  std::string number;
  std::string country_iso;
};

} // namespace mba
