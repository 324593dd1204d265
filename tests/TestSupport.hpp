#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/StorageAllocator.hpp"
#include "core/transfer/TransferEngine.hpp"
#include "core/util/Ids.hpp"

namespace ifs::test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
struct ScratchDir {
  fs::path path;

  ScratchDir() : path(fs::temp_directory_path() / ("ifs-test-" + uuid4())) {
    fs::create_directories(path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

inline std::string readFile(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

inline void writeFile(const fs::path& p, const std::string& content) {
  std::ofstream out(p, std::ios::binary);
  out << content;
}

// Deterministic non-repeating-ish payload.
inline std::string makePayload(size_t n) {
  std::string s(n, '\0');
  uint32_t x = 2463534242u;
  for (size_t i = 0; i < n; ++i) {
    x ^= x << 13; x ^= x >> 17; x ^= x << 5;
    s[i] = static_cast<char>(x & 0xff);
  }
  return s;
}

inline std::string drain(RangeReader& reader) {
  std::string out, piece;
  while (reader.next(piece)) out += piece;
  return out;
}

inline FileRecord makeRecord(const std::string& storedName, int64_t size, int64_t uploadTime,
                             bool isVideo = false) {
  FileRecord r;
  r.id            = uuid4();
  r.original_name = "original-" + storedName;
  r.stored_name   = storedName;
  r.file_path     = "/nonexistent/" + storedName;
  r.file_size     = size;
  r.mime_type     = isVideo ? "video/mp4" : "application/octet-stream";
  r.upload_time   = uploadTime;
  r.is_video      = isVideo;
  return r;
}

// Database + storage root + engine in a scratch directory.
class EngineTest : public ::testing::Test {
protected:
  ScratchDir dir;
  std::string dbPath = (dir.path / "files.db").string();
  StorageAllocator storage{(dir.path / "storage").string()};
  std::unique_ptr<MetadataStore> store;
  std::unique_ptr<TransferEngine> engine;

  virtual TransferLimits limits() const {
    TransferLimits l;
    l.max_file_size = 1024 * 1024;
    l.chunk_size    = 64 * 1024;
    l.session_timeout = std::chrono::seconds(30);
    return l;
  }

  void SetUp() override {
    initDatabase(dbPath, IFS_SCHEMA_PATH);
    storage.ensureWritable();
    store  = std::make_unique<MetadataStore>(dbPath);
    engine = std::make_unique<TransferEngine>(storage, *store, limits());
  }

  FileRecord upload(const std::string& name, const std::string& content) {
    auto sid = engine->beginUpload(name, content.size());
    const size_t chunk = static_cast<size_t>(engine->limits().chunk_size);
    for (size_t off = 0; off < content.size(); off += chunk) {
      engine->ingest(sid, off, std::string_view(content).substr(off, chunk));
    }
    return engine->finalize(sid);
  }

  // Regular files, not counting dotfiles such as the root lock.
  size_t filesIn(const fs::path& p) const {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(p)) {
      if (e.is_regular_file() && e.path().filename().string()[0] != '.') ++n;
    }
    return n;
  }
};

} // namespace ifs::test
