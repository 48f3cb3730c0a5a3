#pragma once
#include <string>

namespace mba {
  class BackupAgent;

  // Start a blocking HTTP server that lets the platform trigger cycles.
  // apiKey: if empty, auth is disabled (useful for early integration).
  void run_http_server(BackupAgent& agent,
                       int port,
                       const std::string& apiKey);
}
