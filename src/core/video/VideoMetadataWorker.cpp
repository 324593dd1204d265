#include "VideoMetadataWorker.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "core/storage/StorageAllocator.hpp"

namespace ifs {

VideoMetadataWorker::VideoMetadataWorker(MetadataStore& store, const StorageAllocator& storage,
                                         std::shared_ptr<VideoProbe> probe)
  : store_(store), storage_(storage), probe_(std::move(probe)) {}

VideoMetadataWorker::~VideoMetadataWorker() { stop(); }

void VideoMetadataWorker::start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_ = std::thread([this] { run(); });
}

void VideoMetadataWorker::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void VideoMetadataWorker::enqueue(const FileRecord& rec) {
  if (!rec.is_video) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(rec);
  }
  cv_.notify_one();
}

size_t VideoMetadataWorker::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

bool VideoMetadataWorker::process(const FileRecord& rec) {
  const std::string thumb = storage_.thumbnailPath(rec.id);
  VideoMetadata info;
  try {
    info = probe_->probe(rec.file_path, thumb);
  } catch (const std::exception& e) {
    spdlog::warn("video probe failed for {} ({}): {}", rec.id, rec.original_name, e.what());
    return false;
  }

  if (!store_.updateVideoMetadata(rec.id, info)) {
    // deleted while we were probing
    std::error_code ec;
    std::filesystem::remove(thumb, ec);
    spdlog::info("video {} vanished before its metadata was stored", rec.id);
    return false;
  }
  spdlog::info("video {}: {}s, {}", rec.id, info.duration, info.resolution);
  return true;
}

void VideoMetadataWorker::run() {
  for (;;) {
    FileRecord rec;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      rec = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      process(rec);
    } catch (const std::exception& e) {
      spdlog::error("video worker: {}", e.what());
    }
  }
}

} // namespace ifs
