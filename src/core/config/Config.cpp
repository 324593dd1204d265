#include "Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Error.hpp"

using nlohmann::json;

namespace ifs {

namespace {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

template <typename T>
T parse_number(const char* key, const std::string& text) {
  try {
    size_t used = 0;
    long long v = std::stoll(text, &used);
    if (used != text.size() || v < 0) throw std::invalid_argument(text);
    return static_cast<T>(v);
  } catch (const std::exception&) {
    throw Error::validation(std::string("invalid value for ") + key + ": '" + text + "'");
  }
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

} // namespace

void Config::validate() const {
  if (server.port <= 0 || server.port > 65535) {
    throw Error::validation("port must be in 1..65535");
  }
  if (storage.storage_root.empty()) throw Error::validation("storage_root must not be empty");
  if (storage.db_path.empty())      throw Error::validation("db_path must not be empty");
  if (storage.max_file_size == 0)   throw Error::validation("max_file_size must not be 0");
  if (storage.chunk_size == 0)      throw Error::validation("chunk_size must not be 0");
  if (storage.chunk_size > storage.max_file_size) {
    throw Error::validation("chunk_size must not exceed max_file_size");
  }
  if (storage.request_timeout.count() <= 0) throw Error::validation("request_timeout must not be 0");
  if (storage.sweep_interval.count() <= 0)  throw Error::validation("sweep_interval must not be 0");
  if (storage.reconcile_interval.count() <= 0) {
    throw Error::validation("reconcile_interval must not be 0");
  }
}

std::string Config::serverAddress() const {
  return server.address + ":" + std::to_string(server.port);
}

void applyJsonConfig(Config& cfg, const std::string& jsonText) {
  json j;
  try {
    j = json::parse(jsonText);
  } catch (const json::parse_error& e) {
    throw Error::validation(std::string("config is not valid JSON: ") + e.what());
  }
  if (!j.is_object()) throw Error::validation("config root must be an object");

  try {
    if (j.contains("server")) {
      const auto& s = j["server"];
      cfg.server.address = s.value("address", cfg.server.address);
      cfg.server.port    = s.value("port", cfg.server.port);
    }
    if (j.contains("storage")) {
      const auto& s = j["storage"];
      cfg.storage.db_path       = s.value("db_path", cfg.storage.db_path);
      cfg.storage.storage_root  = s.value("path", cfg.storage.storage_root);
      cfg.storage.max_file_size = s.value("max_file_size", cfg.storage.max_file_size);
      cfg.storage.chunk_size    = s.value("chunk_size", cfg.storage.chunk_size);
      if (s.contains("request_timeout")) {
        cfg.storage.request_timeout = std::chrono::seconds(s["request_timeout"].get<int64_t>());
      }
      if (s.contains("sweep_interval")) {
        cfg.storage.sweep_interval = std::chrono::seconds(s["sweep_interval"].get<int64_t>());
      }
      if (s.contains("reconcile_interval")) {
        cfg.storage.reconcile_interval = std::chrono::seconds(s["reconcile_interval"].get<int64_t>());
      }
    }
    if (j.contains("video")) {
      const auto& v = j["video"];
      cfg.video.thumbnail_size = v.value("thumbnail_size", cfg.video.thumbnail_size);
      cfg.video.ffprobe        = v.value("ffprobe", cfg.video.ffprobe);
      cfg.video.ffmpeg         = v.value("ffmpeg", cfg.video.ffmpeg);
      if (v.contains("supported_formats")) {
        cfg.video.supported_formats = v["supported_formats"].get<std::vector<std::string>>();
      }
    }
    cfg.log_level = j.value("log_level", cfg.log_level);
  } catch (const json::type_error& e) {
    throw Error::validation(std::string("config has a value of the wrong type: ") + e.what());
  }
}

void applyEnvConfig(Config& cfg) {
  cfg.server.address = get_env_or("IFS_ADDRESS", cfg.server.address);
  if (auto p = get_env_or("IFS_PORT", ""); !p.empty()) {
    cfg.server.port = parse_number<int>("IFS_PORT", p);
  }
  cfg.storage.db_path      = get_env_or("IFS_DB_PATH", cfg.storage.db_path);
  cfg.storage.storage_root = get_env_or("IFS_STORAGE_ROOT", cfg.storage.storage_root);
  if (auto v = get_env_or("IFS_MAX_FILE_SIZE", ""); !v.empty()) {
    cfg.storage.max_file_size = parse_number<uint64_t>("IFS_MAX_FILE_SIZE", v);
  }
  if (auto v = get_env_or("IFS_CHUNK_SIZE", ""); !v.empty()) {
    cfg.storage.chunk_size = parse_number<uint64_t>("IFS_CHUNK_SIZE", v);
  }
  if (auto v = get_env_or("IFS_REQUEST_TIMEOUT", ""); !v.empty()) {
    cfg.storage.request_timeout = std::chrono::seconds(parse_number<int64_t>("IFS_REQUEST_TIMEOUT", v));
  }
  if (auto v = get_env_or("IFS_SWEEP_INTERVAL", ""); !v.empty()) {
    cfg.storage.sweep_interval = std::chrono::seconds(parse_number<int64_t>("IFS_SWEEP_INTERVAL", v));
  }
  if (auto v = get_env_or("IFS_RECONCILE_INTERVAL", ""); !v.empty()) {
    cfg.storage.reconcile_interval =
      std::chrono::seconds(parse_number<int64_t>("IFS_RECONCILE_INTERVAL", v));
  }
  cfg.video.thumbnail_size = get_env_or("IFS_THUMBNAIL_SIZE", cfg.video.thumbnail_size);
  cfg.video.ffprobe        = get_env_or("IFS_FFPROBE", cfg.video.ffprobe);
  cfg.video.ffmpeg         = get_env_or("IFS_FFMPEG", cfg.video.ffmpeg);
  if (auto v = get_env_or("IFS_VIDEO_FORMATS", ""); !v.empty()) {
    cfg.video.supported_formats = split_list(v);
  }
  cfg.log_level = get_env_or("IFS_LOG_LEVEL", cfg.log_level);
}

Config loadConfig() {
  Config cfg;
  const std::string file = get_env_or("IFS_CONFIG", "");
  if (!file.empty()) {
    std::ifstream in(file);
    if (!in) throw Error::validation("cannot open config file: " + file);
    std::ostringstream buf; buf << in.rdbuf();
    applyJsonConfig(cfg, buf.str());
    spdlog::info("loaded config file {}", file);
  }
  applyEnvConfig(cfg);
  cfg.validate();
  return cfg;
}

} // namespace ifs
