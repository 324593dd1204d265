#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ifs {

struct FileRecord {
  std::string id;
  std::string original_name;
  std::string stored_name;
  std::string file_path;
  int64_t     file_size = 0;
  std::string mime_type;
  int64_t     upload_time = 0; // epoch millis, set at finalization

  // filled in out-of-band by the video worker
  bool                       is_video = false;
  std::optional<std::string> thumbnail_path;
  std::optional<double>      video_duration;
  std::optional<std::string> video_resolution;
};

struct VideoMetadata {
  double                     duration = 0.0;
  std::string                resolution; // "1920x1080"
  std::optional<std::string> thumbnail_path;
};

struct StoreStats {
  int64_t total_files = 0;
  int64_t total_size  = 0;
  int64_t video_count = 0;
};

class MetadataStore {
public:
  // Opens an existing database; run initDatabase() first.
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore();

  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;

  // BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit()
  // was called. Holds the store lock, so statements from other threads wait.
  class Transaction {
  public:
    explicit Transaction(MetadataStore& store);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

  private:
    MetadataStore& store_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool done_ = false;
  };

  // Throws Conflict on a duplicate id or stored_name, PersistenceFailure on
  // anything else the database rejects.
  void insertFile(const FileRecord& r);

  std::optional<FileRecord> getFileById(const std::string& id);

  // Newest first. limit must be positive, offset non-negative.
  std::vector<FileRecord> listFiles(int limit = 50, int offset = 0, bool videosOnly = false);

  bool deleteFile(const std::string& id);

  StoreStats stats();

  bool updateVideoMetadata(const std::string& id, const VideoMetadata& fields);

private:
  void exec(const char* sql);

  void* db_; // sqlite3*
  std::recursive_mutex mu_;
};

} // namespace ifs
