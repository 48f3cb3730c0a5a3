// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/agent/BackupAgent.hpp"
#include "core/config/AgentConfig.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/InitDb.hpp"
#include "core/store/SqliteMessageStore.hpp"
#include "core/store/SqlitePreferences.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/store/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/store)");
}

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static int64_t parse_bytes(const char* arg) {
  const std::string s(arg);
  size_t used = 0;
  const long long v = std::stoll(s, &used);
  if (used != s.size() || v < 0) throw std::invalid_argument("not a byte count: " + s);
  return v;
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                       # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --backup                     # run one backup cycle\n"
            << "  " << argv0 << " --restore                    # restore from the archive\n"
            << "  " << argv0 << " --quota-exceeded <bytes> <quota>\n"
            << "  " << argv0 << " --serve                      # start HTTP server (MBA_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      print_usage(argv[0]);
      return 1;
    }
    const std::string cmd = argv[1];
    if (cmd != "--init" && cmd != "--backup" && cmd != "--restore" &&
        cmd != "--quota-exceeded" && cmd != "--serve") {
      print_usage(argv[0]);
      return 1;
    }
    if (cmd == "--quota-exceeded" && argc < 4) {
      print_usage(argv[0]);
      return 1;
    }

    const mba::AgentConfig cfg = mba::loadConfigFromEnv();
    mba::applyLogLevel(cfg);

    // Self-heal DB on every start (idempotent)
    ensure_dirs_for(cfg.dbPath);
    mba::initDatabase(cfg.dbPath, findSchemaPath());
    if (cmd == "--init") {
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    // Construct services
    mba::SqliteMessageStore store(cfg.dbPath);
    mba::SqlitePreferences prefs(cfg.dbPath);
    mba::LocalFSBackend archive(cfg.archiveDir, cfg.archiveQuotaBytes);
    mba::BackupAgent agent(store, prefs, archive,
                           mba::AgentOptions{cfg.stagingDir, cfg.restoreDir, cfg.maxMessagesPerFile});

    if (cmd == "--backup") {
      const auto report = agent.runBackup();
      std::cout << "archived " << report.chunksHandedOff << " chunk(s), withheld "
                << report.chunksWithheld << "\n";
      return 0;
    }

    if (cmd == "--restore") {
      const auto report = agent.runRestore();
      std::cout << "restored " << report.filesRestored << " file(s), "
                << report.filesFailed << " failed\n";
      return report.filesFailed == 0 ? 0 : 3;
    }

    if (cmd == "--quota-exceeded") {
      agent.onQuotaExceeded(parse_bytes(argv[2]), parse_bytes(argv[3]));
      return 0;
    }

    mba::run_http_server(agent, cfg.port, cfg.apiKey);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
