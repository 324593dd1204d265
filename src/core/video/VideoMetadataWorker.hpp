#pragma once
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "core/metadata/MetadataStore.hpp"
#include "core/video/VideoProbe.hpp"

namespace ifs {

class StorageAllocator;

// Probes finalized videos on a background thread and writes the results
// back with MetadataStore::updateVideoMetadata. Failures are logged only;
// the upload that produced the file has already succeeded.
class VideoMetadataWorker {
public:
  VideoMetadataWorker(MetadataStore& store, const StorageAllocator& storage,
                      std::shared_ptr<VideoProbe> probe);
  ~VideoMetadataWorker();

  VideoMetadataWorker(const VideoMetadataWorker&) = delete;
  VideoMetadataWorker& operator=(const VideoMetadataWorker&) = delete;

  void start();
  void stop();

  // Non-blocking; non-video records are ignored.
  void enqueue(const FileRecord& rec);

  // Probes one record on the calling thread. Returns true when the row was
  // updated.
  bool process(const FileRecord& rec);

  size_t pending() const;

private:
  void run();

  MetadataStore& store_;
  const StorageAllocator& storage_;
  std::shared_ptr<VideoProbe> probe_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<FileRecord> queue_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace ifs
