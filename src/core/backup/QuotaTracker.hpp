#pragma once
#include <cstdint>

#include "core/store/KeyValueStore.hpp"

namespace mba {

// Overage is inflated by 10% so the next cycle is more likely to fit.
constexpr double kBytesOverQuotaMultiplier = 1.1;
constexpr int64_t kQuotaResetIntervalMs = 30LL * 24 * 60 * 60 * 1000;

namespace prefs {
constexpr const char* kBackupDataBytes = "backup_data_bytes";
constexpr const char* kQuotaBytes      = "backup_quota_bytes";
constexpr const char* kQuotaResetTime  = "reset_quota_time";
} // namespace prefs

// Tracks how far the previous backup overshot the destination quota and
// spends that overage by withholding the oldest chunks of the next cycle.
class QuotaTracker {
public:
  explicit QuotaTracker(KeyValueStore& prefs);

  // Starts a cycle: drops expired state and computes the withhold budget.
  void beginCycle(int64_t nowMillis);

  // True if a chunk of chunkBytes must be withheld; charges it to the budget.
  bool shouldWithhold(int64_t chunkBytes);

  int64_t bytesOverQuota() const { return bytesOverQuota_; }

  // Transport notification. Persisted before returning.
  void onQuotaExceeded(int64_t backupDataBytes, int64_t quotaBytes, int64_t nowMillis);

  void clear();

private:
  KeyValueStore& prefs_;
  int64_t bytesOverQuota_ = 0;
};

} // namespace mba
