#include "QuotaTracker.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace mba {

// Truncates toward zero, saturating at the int64 range.
static int64_t toBytes(double v) {
  constexpr double kLimit = 9223372036854775807.0; // rounds to 2^63
  if (v >= kLimit) return std::numeric_limits<int64_t>::max();
  if (v <= -kLimit) return std::numeric_limits<int64_t>::min();
  return static_cast<int64_t>(v);
}

static int64_t inflateOverage(int64_t bytes) {
  return toBytes(static_cast<double>(bytes) * kBytesOverQuotaMultiplier);
}

QuotaTracker::QuotaTracker(KeyValueStore& prefs) : prefs_(prefs) {}

void QuotaTracker::beginCycle(int64_t nowMillis) {
  const int64_t resetAt =
      prefs_.getLong(prefs::kQuotaResetTime, std::numeric_limits<int64_t>::max());
  if (resetAt < nowMillis) {
    spdlog::info("quota state expired, starting fresh");
    clear();
  }

  bytesOverQuota_ = prefs_.getLong(prefs::kBackupDataBytes, 0) -
                    prefs_.getLong(prefs::kQuotaBytes, std::numeric_limits<int64_t>::max());
  if (bytesOverQuota_ > 0) {
    bytesOverQuota_ = inflateOverage(bytesOverQuota_);
    spdlog::info("previous backup was over quota, withholding the oldest {} bytes",
                 bytesOverQuota_);
  }
}

bool QuotaTracker::shouldWithhold(int64_t chunkBytes) {
  if (bytesOverQuota_ <= 0) return false;
  bytesOverQuota_ -= chunkBytes;
  return true;
}

void QuotaTracker::onQuotaExceeded(int64_t backupDataBytes, int64_t quotaBytes,
                                   int64_t nowMillis) {
  if (backupDataBytes < 0 || quotaBytes < 0) {
    throw std::invalid_argument("negative byte count: " + std::to_string(backupDataBytes) +
                                "/" + std::to_string(quotaBytes));
  }
  if (prefs_.contains(prefs::kBackupDataBytes) && prefs_.contains(prefs::kQuotaBytes)) {
    // Add back what the previous cycle withheld.
    const int64_t previous =
        prefs_.getLong(prefs::kBackupDataBytes, 0) - prefs_.getLong(prefs::kQuotaBytes, 0);
    backupDataBytes = toBytes(static_cast<double>(backupDataBytes) +
                              static_cast<double>(previous) * kBytesOverQuotaMultiplier);
  }
  prefs_.putLongs({
    {prefs::kBackupDataBytes, backupDataBytes},
    {prefs::kQuotaBytes, quotaBytes},
    {prefs::kQuotaResetTime, nowMillis + kQuotaResetIntervalMs},
  });
  spdlog::warn("quota exceeded: {} bytes against a quota of {}", backupDataBytes, quotaBytes);
}

void QuotaTracker::clear() {
  prefs_.remove({prefs::kBackupDataBytes, prefs::kQuotaBytes, prefs::kQuotaResetTime});
}

} // namespace mba
