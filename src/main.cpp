// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/StorageAllocator.hpp"
#include "core/transfer/TransferEngine.hpp"
#include "core/util/PeriodicTask.hpp"
#include "core/video/VideoMetadataWorker.hpp"
#include "services/api/HttpServer.hpp"

using namespace ifs;

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it next to the binary),
// then the source tree.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --reconcile   # delete orphan files and rows, then exit\n"
            << "  " << argv0 << " --serve       # start HTTP server (IFS_PORT or 3000)\n"
            << "Configuration: IFS_CONFIG=<file.json> and IFS_* environment variables.\n";
}

static TransferLimits limitsFrom(const Config& cfg) {
  TransferLimits limits;
  limits.max_file_size    = cfg.storage.max_file_size;
  limits.chunk_size       = cfg.storage.chunk_size;
  limits.session_timeout  = cfg.storage.request_timeout;
  limits.video_extensions = cfg.video.supported_formats;
  return limits;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string cmd = argc > 1 ? argv[1] : "";
    if (cmd != "--init" && cmd != "--serve" && cmd != "--reconcile") {
      print_usage(argv[0]);
      return 1;
    }

    Config cfg = loadConfig();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    cfg.storage.storage_root = std::filesystem::absolute(cfg.storage.storage_root).string();

    // Self-heal DB on every start (idempotent)
    initDatabase(cfg.storage.db_path, findSchemaPath());
    if (cmd == "--init") {
      std::cout << "DB initialized at: " << cfg.storage.db_path << "\n";
      return 0;
    }

    StorageAllocator storage(cfg.storage.storage_root);
    storage.ensureWritable();

    MetadataStore store(cfg.storage.db_path);
    TransferEngine engine(storage, store, limitsFrom(cfg));

    // Anything left over from a previous process is an orphan now.
    const auto report = engine.reconcile();
    if (cmd == "--reconcile") {
      std::cout << "orphan files: " << report.orphan_files
                << ", orphan rows: " << report.orphan_rows
                << ", stale temp files: " << report.stale_temp_files
                << ", orphan thumbnails: " << report.orphan_thumbnails << "\n";
      return 0;
    }

    VideoMetadataWorker videos(store, storage,
                               std::make_shared<FfmpegVideoProbe>(cfg.video.ffprobe, cfg.video.ffmpeg,
                                                                  cfg.video.thumbnail_size));
    videos.start();
    engine.setFinalizeListener([&videos](const FileRecord& rec) { videos.enqueue(rec); });

    PeriodicTask sweeper("session sweep", cfg.storage.sweep_interval,
                         [&engine] { engine.expireStale(); });
    PeriodicTask reconciler("reconcile", cfg.storage.reconcile_interval,
                            [&engine] { engine.reconcile(); });
    sweeper.start();
    reconciler.start();

    spdlog::info("storage root {}, db {}, max file {} bytes, chunk {} bytes",
                 cfg.storage.storage_root, cfg.storage.db_path,
                 cfg.storage.max_file_size, cfg.storage.chunk_size);

    const bool ok = run_http_server(engine, cfg);

    reconciler.stop();
    sweeper.stop();
    videos.stop();
    return ok ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
