#pragma once
#include <string>

namespace ifs {
  struct Config;
  class TransferEngine;

  // Start a blocking HTTP server exposing the upload, download and file
  // management endpoints. Returns when the server stops or fails to bind.
  bool run_http_server(TransferEngine& engine, const Config& cfg);
}
