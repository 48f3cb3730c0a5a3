#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>

#include "core/agent/BackupAgent.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled for now
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static const char* fate_name(mba::ChunkRecord::Fate f) {
  switch (f) {
    case mba::ChunkRecord::Fate::HandedOff: return "archived";
    case mba::ChunkRecord::Fate::Withheld:  return "withheld";
    case mba::ChunkRecord::Fate::Empty:     return "empty";
  }
  return "unknown";
}

static json to_json(const mba::BackupReport& r) {
  json chunks = json::array();
  for (const auto& c : r.chunks) {
    chunks.push_back({
      {"name", c.name},
      {"entries", c.entries},
      {"bytes", c.bytes},
      {"fate", fate_name(c.fate)}
    });
  }
  return {
    {"chunks_archived", r.chunksHandedOff},
    {"chunks_withheld", r.chunksWithheld},
    {"chunks_empty", r.chunksEmpty},
    {"sms_entries", r.smsEntries},
    {"mms_entries", r.mmsEntries},
    {"bytes_archived", r.bytesHandedOff},
    {"bytes_withheld", r.bytesWithheld},
    {"chunks", chunks}
  };
}

static json to_json(const mba::RestoreReport& r) {
  return {
    {"files_restored", r.filesRestored},
    {"files_failed", r.filesFailed},
    {"sms_inserted", r.smsInserted},
    {"sms_skipped", r.smsSkipped},
    {"mms_inserted", r.mmsInserted},
    {"mms_skipped", r.mmsSkipped},
    {"mms_failed", r.mmsFailed}
  };
}

static void fail(httplib::Response& res, int status, const std::string& msg) {
  res.status = status;
  res.set_content(json({{"error", msg}}).dump(), "application/json");
}

// Non-negative JSON integer that fits in int64.
static bool is_byte_count(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_unsigned()) return false;
  return it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

// -------- server --------

namespace mba {

void run_http_server(BackupAgent& agent,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  std::mutex cycleMutex; // one cycle at a time

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /backup: run one backup cycle, reply with the chunk report
  svr.Post("/backup", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(cycleMutex);
    try {
      const BackupReport report = agent.runBackup();
      res.status = 200;
      res.set_content(to_json(report).dump(), "application/json");
    } catch (const std::exception& e) {
      spdlog::error("backup failed: {}", e.what());
      fail(res, 500, "backup failed");
    }
  });

  // POST /restore: pull the archive and replay it into the store
  svr.Post("/restore", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(cycleMutex);
    try {
      const RestoreReport report = agent.runRestore();
      res.status = 200;
      res.set_content(to_json(report).dump(), "application/json");
    } catch (const std::exception& e) {
      spdlog::error("restore failed: {}", e.what());
      fail(res, 500, "restore failed");
    }
  });

  // POST /quota-exceeded
  // Body: {"backup_data_bytes": <int>, "quota_bytes": <int>}
  svr.Post("/quota-exceeded", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;

    json j;
    try { j = json::parse(req.body); }
    catch (const json::parse_error&) { fail(res, 400, "invalid JSON body"); return; }

    if (!j.is_object() || !is_byte_count(j, "backup_data_bytes") ||
        !is_byte_count(j, "quota_bytes")) {
      fail(res, 422, "backup_data_bytes and quota_bytes (non-negative integers) required");
      return;
    }

    std::lock_guard<std::mutex> lock(cycleMutex);
    try {
      agent.onQuotaExceeded(j["backup_data_bytes"].get<int64_t>(), j["quota_bytes"].get<int64_t>());
    } catch (const std::invalid_argument& e) {
      fail(res, 422, e.what());
      return;
    } catch (const std::exception& e) {
      spdlog::error("quota update failed: {}", e.what());
      fail(res, 500, "quota update failed");
      return;
    }
    res.status = 200;
    res.set_content(json({{"status", "recorded"}}).dump(), "application/json");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace mba
