#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ifs {

struct ServerConfig {
  std::string address = "0.0.0.0";
  int         port    = 3000;
};

struct StorageConfig {
  std::string db_path      = "data/files.db";
  std::string storage_root = "data/storage";
  uint64_t    max_file_size = 10ULL * 1024 * 1024 * 1024; // 10 GiB
  uint64_t    chunk_size    = 8ULL * 1024 * 1024;         // 8 MiB
  std::chrono::seconds request_timeout{300};
  std::chrono::seconds sweep_interval{60};
  std::chrono::seconds reconcile_interval{3600};
};

struct VideoConfig {
  std::string thumbnail_size = "320x240";
  std::vector<std::string> supported_formats{"mp4", "avi", "mkv", "mov", "wmv", "flv", "webm"};
  std::string ffprobe = "ffprobe";
  std::string ffmpeg  = "ffmpeg";
};

struct Config {
  ServerConfig  server;
  StorageConfig storage;
  VideoConfig   video;
  std::string   log_level = "info";

  // Throws ifs::Error(Validation) on a knob that makes no sense.
  void validate() const;

  std::string serverAddress() const;
};

// Defaults, then the JSON file named by IFS_CONFIG (if any), then IFS_*
// environment variables.
Config loadConfig();

// Overlays the keys present in a JSON document onto cfg.
void applyJsonConfig(Config& cfg, const std::string& jsonText);

// Overlays IFS_* environment variables onto cfg.
void applyEnvConfig(Config& cfg);

} // namespace ifs
