#include "ChunkName.hpp"
#include <cstdio>

namespace mba {

static const std::string kSmsSuffix = "_sms_backup";
static const std::string kMmsSuffix = "_mms_backup";

static bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string chunkFileName(int sequence, RecordKind kind) {
  char num[16];
  std::snprintf(num, sizeof(num), "%06d", sequence);
  return std::string(num) + (kind == RecordKind::Sms ? kSmsSuffix : kMmsSuffix);
}

std::optional<RecordKind> chunkKindOf(const std::string& fileName) {
  if (endsWith(fileName, kSmsSuffix)) return RecordKind::Sms;
  if (endsWith(fileName, kMmsSuffix)) return RecordKind::Mms;
  return std::nullopt;
}

} // namespace mba
