#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/metadata/MetadataStore.hpp"
#include "core/transfer/RangeReader.hpp"
#include "core/transfer/UploadSessionTracker.hpp"

namespace ifs {

class StorageAllocator;

struct TransferLimits {
  uint64_t max_file_size = 10ULL * 1024 * 1024 * 1024;
  uint64_t chunk_size    = 8ULL * 1024 * 1024;
  std::chrono::milliseconds session_timeout{std::chrono::seconds(300)};
  std::vector<std::string> video_extensions{"mp4", "avi", "mkv", "mov", "wmv", "flv", "webm"};
};

struct ReconcileReport {
  size_t orphan_files = 0;       // finalized files with no row, deleted
  size_t orphan_rows = 0;        // rows whose file is missing, deleted
  size_t stale_temp_files = 0;   // temp files no live session owns, deleted
  size_t orphan_thumbnails = 0;

  size_t total() const {
    return orphan_files + orphan_rows + stale_temp_files + orphan_thumbnails;
  }
};

// Coordinates chunked uploads, the rename-then-insert commit, range reads
// and deletes. Owns the upload session registry.
//
// Commit order is rename first, insert second, with a compensating delete
// when the insert fails. A crash in between leaves a file without a row,
// which reconcile() reclaims; a row without a file is never produced.
class TransferEngine {
public:
  using FinalizeListener = std::function<void(const FileRecord&)>;

  TransferEngine(const StorageAllocator& storage, MetadataStore& store, TransferLimits limits);

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  std::string beginUpload(const std::string& original_name, uint64_t expected_size);
  void ingest(const std::string& session_id, uint64_t offset, std::string_view chunk);
  FileRecord finalize(const std::string& session_id);
  void abort(const std::string& session_id);
  SessionStatus uploadStatus(const std::string& session_id);

  // end defaults to the file size.
  RangeReader readRange(const std::string& id, uint64_t start = 0,
                        std::optional<uint64_t> end = std::nullopt);

  void remove(const std::string& id);

  std::optional<FileRecord> getFile(const std::string& id);
  std::vector<FileRecord> listFiles(int limit = 50, int offset = 0, bool videosOnly = false);
  StoreStats stats();

  size_t expireStale(UploadSessionTracker::Clock::time_point now = UploadSessionTracker::Clock::now());
  ReconcileReport reconcile();

  // Called after every successful finalize. Must not block.
  void setFinalizeListener(FinalizeListener listener) { onFinalized_ = std::move(listener); }

  const TransferLimits& limits() const { return limits_; }
  size_t activeUploads() const { return sessions_.activeCount(); }

private:
  bool isVideoExtension(const std::string& ext) const;

  const StorageAllocator& storage_;
  MetadataStore&          store_;
  TransferLimits          limits_;
  UploadSessionTracker    sessions_;
  FinalizeListener        onFinalized_;

  // Shared by operations that create or delete files, exclusive for
  // reconcile(), so the sweep never observes a half-done commit.
  std::shared_mutex layoutMu_;
};

} // namespace ifs
