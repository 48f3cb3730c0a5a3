#include "RestoreEngine.hpp"
#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

#include "core/storage/ChunkName.hpp"
#include "core/storage/CompressedFile.hpp"

namespace mba {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr int kSmilDurationMs = 5000;
constexpr const char* kAppSmil = "application/smil";
constexpr const char* kTextPlain = "text/plain";

} // namespace

std::string textOnlySmil(const std::string& textPartName) {
  return "<smil><head><layout><root-layout/>"
         "<region id=\"Text\" top=\"0\" left=\"0\" height=\"100%\" width=\"100%\"/>"
         "</layout></head><body>"
         "<par dur=\"" + std::to_string(kSmilDurationMs) + "ms\">"
         "<text src=\"" + textPartName + "\" region=\"Text\" />"
         "</par></body></smil>";
}

RestoreEngine::RestoreEngine(MessageStore& store, RestoreOptions options, Clock nowMillis)
  : store_(store), options_(options), nowMillis_(std::move(nowMillis)) {
  if (options_.maxMessagesPerFile <= 0) options_.maxMessagesPerFile = 1000;
}

// -------- files --------

RestoreReport RestoreEngine::restoreDirectory(const fs::path& dir, IdentityResolver& identity) {
  RestoreReport report;
  if (!fs::is_directory(dir)) {
    spdlog::info("nothing to restore in {}", dir.string());
    return report;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    if (chunkKindOf(entry.path().filename().string())) files.push_back(entry.path());
  }
  // Newest chunk first so recent messages are available early.
  std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() > b.filename().string();
  });

  for (const auto& file : files) {
    try {
      restoreFile(file, identity, report);
      ++report.filesRestored;
      std::error_code ec;
      fs::remove(file, ec);
      if (ec) spdlog::warn("restored {} but could not delete it: {}", file.string(), ec.message());
    } catch (const std::exception& e) {
      ++report.filesFailed;
      spdlog::warn("restore of {} failed, keeping it for the next pass: {}",
                   file.filename().string(), e.what());
    }
  }

  spdlog::info("restore pass done: {} files restored, {} failed; sms +{} ({} dup), "
               "mms +{} ({} dup, {} failed)",
               report.filesRestored, report.filesFailed, report.smsInserted, report.smsSkipped,
               report.mmsInserted, report.mmsSkipped, report.mmsFailed);
  return report;
}

void RestoreEngine::restoreFile(const fs::path& path, IdentityResolver& identity,
                                RestoreReport& report) {
  const auto name = path.filename().string();
  const auto kind = chunkKindOf(name);
  if (!kind) {
    spdlog::error("unknown file to restore: {}", name);
    return;
  }
  spdlog::info("restoring {}", name);

  const std::string text = inflateFile(path);
  json entries;
  try {
    entries = json::parse(text);
  } catch (const json::parse_error& e) {
    throw CodecError(name + " is not valid JSON: " + e.what());
  }
  if (!entries.is_array()) throw CodecError(name + " does not hold a JSON array");

  if (*kind == RecordKind::Sms) {
    restoreSmsEntries(entries, identity, report);
  } else {
    restoreMmsEntries(entries, identity, report);
  }
}

// -------- sms --------

void RestoreEngine::restoreSmsEntries(const json& entries, IdentityResolver& identity,
                                      RestoreReport& report) {
  RecordDecoder decoder(identity);
  const auto batchSize = static_cast<size_t>(options_.maxMessagesPerFile);
  std::vector<RestoredSms> batch;
  batch.reserve(std::min(batchSize, entries.size()));

  for (const auto& entry : entries) {
    RestoredSms sms = decoder.decodeSms(entry);
    if (sms.date && store_.smsExists(*sms.date, sms.body)) {
      ++report.smsSkipped;
      continue;
    }
    batch.push_back(std::move(sms));
    if (batch.size() == batchSize) {
      report.smsInserted += static_cast<int64_t>(store_.bulkInsertSms(batch));
      batch.clear();
    }
  }
  if (!batch.empty()) report.smsInserted += static_cast<int64_t>(store_.bulkInsertSms(batch));
}

// -------- mms --------

void RestoreEngine::restoreMmsEntries(const json& entries, IdentityResolver& identity,
                                      RestoreReport& report) {
  RecordDecoder decoder(identity);
  for (const auto& entry : entries) {
    const RestoredMms mms = decoder.decodeMms(entry);
    if (mmsExists(mms)) {
      spdlog::debug("mms dated {} already exists", mms.date.value_or(0));
      ++report.mmsSkipped;
      continue;
    }
    if (addMmsMessage(mms)) {
      ++report.mmsInserted;
    } else {
      ++report.mmsFailed;
    }
  }
}

bool RestoreEngine::mmsExists(const RestoredMms& mms) {
  if (!mms.date || !mms.body) return false;
  for (int64_t id : store_.mmsIdsWithDate(*mms.date)) {
    const auto body = store_.mmsBody(id);
    if (body && *body == *mms.body) return true;
  }
  return false;
}

bool RestoreEngine::addMmsMessage(const RestoredMms& mms) {
  // Parts are written before the message exists, under a placeholder id.
  const int64_t placeholderId = nowMillis_();
  const std::string srcName = "text.000000.txt";
  const MmsBody body = mms.body.value_or(MmsBody{"", kDefaultCharset});

  MmsPart smil;
  smil.seq = -1;
  smil.content_type = kAppSmil;
  smil.name = "smil.xml";
  smil.content_id = "<smil>";
  smil.content_location = "smil.xml";
  smil.text = textOnlySmil(srcName);
  if (!store_.insertMmsPart(placeholderId, smil)) {
    spdlog::warn("could not insert SMIL part, dropping mms dated {}", mms.date.value_or(0));
    return false;
  }

  MmsPart text;
  text.seq = 0;
  text.content_type = kTextPlain;
  text.name = srcName;
  text.content_id = "<" + srcName + ">";
  text.content_location = srcName;
  text.charset = body.charset;
  text.text = body.text;
  if (!store_.insertMmsPart(placeholderId, text)) {
    spdlog::warn("could not insert body part, dropping mms dated {}", mms.date.value_or(0));
    store_.deleteMmsParts(placeholderId);
    return false;
  }

  const auto mmsId = store_.insertMms(mms);
  if (!mmsId) {
    spdlog::warn("could not insert mms dated {}", mms.date.value_or(0));
    store_.deleteMmsParts(placeholderId);
    return false;
  }

  store_.updateMmsPartsMessageId(placeholderId, *mmsId);

  for (const auto& addr : mms.addresses) {
    if (!store_.insertMmsAddress(*mmsId, addr)) {
      spdlog::warn("could not insert address {} of mms {}", addr.address, *mmsId);
    }
  }
  return true;
}

} // namespace mba
