#include "AgentConfig.hpp"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace mba {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int64_t envInt64Or(const char* key, int64_t defval, int64_t minval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    const long long v = std::stoll(raw, &used);
    if (used == raw.size() && v >= minval) return v;
  } catch (const std::logic_error&) {
    // handled below
  }
  spdlog::warn("{}='{}' is not valid, using {}", key, raw, defval);
  return defval;
}

AgentConfig loadConfigFromEnv() {
  AgentConfig cfg;
  cfg.dbPath     = get_env_or("MBA_DB_PATH", "data/messages.db");
  cfg.stagingDir = get_env_or("MBA_STAGING_DIR", "data/staging");
  cfg.archiveDir = get_env_or("MBA_ARCHIVE_DIR", "data/archive");
  cfg.restoreDir = get_env_or("MBA_RESTORE_DIR", "data/restore");
  cfg.maxMessagesPerFile =
      static_cast<int>(envInt64Or("MBA_MAX_MSG_PER_FILE", cfg.maxMessagesPerFile, 1));
  cfg.port = static_cast<int>(envInt64Or("MBA_PORT", cfg.port, 1));
  cfg.apiKey   = get_env_or("MBA_API_KEY", "");
  cfg.logLevel = get_env_or("MBA_LOG_LEVEL", cfg.logLevel);

  const int64_t quota = envInt64Or("MBA_ARCHIVE_QUOTA_BYTES", -1, 0);
  if (quota >= 0) cfg.archiveQuotaBytes = quota;
  return cfg;
}

void applyLogLevel(const AgentConfig& cfg) {
  const auto level = spdlog::level::from_str(cfg.logLevel);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && cfg.logLevel != "off") {
    spdlog::warn("unknown log level '{}', keeping info", cfg.logLevel);
    spdlog::set_level(spdlog::level::info);
    return;
  }
  spdlog::set_level(level);
}

} // namespace mba
