#pragma once
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "core/identity/IdentityResolver.hpp"
#include "core/store/MessageStore.hpp"
#include "core/store/Records.hpp"

namespace mba {

// Archive keys that do not map one to one onto a column.
namespace keys {
constexpr const char* kSelfPhone     = "self_phone";
constexpr const char* kRecipients    = "recipients";
constexpr const char* kMmsAddresses  = "mms_addresses";
constexpr const char* kMmsBody       = "mms_body";
constexpr const char* kMmsCharset    = "mms_charset";
} // namespace keys

// An archive entry whose value cannot be converted to its field type.
class CodecError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Turns store rows into archive entries. Keys are emitted in column order.
class RecordEncoder {
public:
  RecordEncoder(IdentityResolver& identity, MessageStore& store);

  nlohmann::ordered_json encodeSms(const SmsRow& row);

  // nullopt when the message has no text body; such messages are not archived.
  std::optional<nlohmann::ordered_json> encodeMms(const MmsRow& row);

private:
  void putIdentity(nlohmann::ordered_json& out, const std::optional<int64_t>& subId);
  void putRecipients(nlohmann::ordered_json& out, int64_t threadId);

  IdentityResolver& identity_;
  MessageStore& store_;
};

// Turns archive entries back into insertable records. Unknown keys are
// skipped; values of known keys must convert or CodecError is thrown.
class RecordDecoder {
public:
  explicit RecordDecoder(IdentityResolver& identity);

  RestoredSms decodeSms(const nlohmann::json& entry);
  RestoredMms decodeMms(const nlohmann::json& entry);

private:
  IdentityResolver& identity_;
};

} // namespace mba
