#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace mba {

struct AgentConfig {
  std::string dbPath;
  std::string stagingDir;
  std::string archiveDir;
  std::string restoreDir;
  int maxMessagesPerFile = 1000;
  std::optional<int64_t> archiveQuotaBytes; // unset = unlimited
  int port = 8080;
  std::string apiKey;                       // empty = auth disabled
  std::string logLevel = "info";
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads MBA_* environment variables. Malformed numbers fall back to defaults.
AgentConfig loadConfigFromEnv();

// Applies cfg.logLevel to the default spdlog logger.
void applyLogLevel(const AgentConfig& cfg);

} // namespace mba
