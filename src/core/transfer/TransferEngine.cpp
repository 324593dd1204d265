#include "TransferEngine.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "core/Error.hpp"
#include "core/storage/StorageAllocator.hpp"
#include "core/util/FileSync.hpp"
#include "core/util/Ids.hpp"
#include "core/util/MimeTypes.hpp"

namespace ifs {

namespace fs = std::filesystem;

namespace {

constexpr int kReconcilePage = 500;
constexpr const char* kTempSuffix = ".part";

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TransferEngine::TransferEngine(const StorageAllocator& storage, MetadataStore& store,
                               TransferLimits limits)
  : storage_(storage), store_(store), limits_(std::move(limits)),
    sessions_(storage, limits_.session_timeout) {
  for (auto& ext : limits_.video_extensions) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }
}

bool TransferEngine::isVideoExtension(const std::string& ext) const {
  return !ext.empty() &&
         std::find(limits_.video_extensions.begin(), limits_.video_extensions.end(), ext) !=
           limits_.video_extensions.end();
}

std::string TransferEngine::beginUpload(const std::string& original_name, uint64_t expected_size) {
  if (original_name.empty()) throw Error::validation("file name is required");
  if (expected_size == 0) throw Error::validation("file size must be positive");
  if (expected_size > limits_.max_file_size) {
    throw Error::validation("file size " + std::to_string(expected_size) +
                            " exceeds the limit of " + std::to_string(limits_.max_file_size));
  }
  std::shared_lock<std::shared_mutex> layout(layoutMu_);
  return sessions_.open(original_name, expected_size);
}

void TransferEngine::ingest(const std::string& session_id, uint64_t offset, std::string_view chunk) {
  if (chunk.size() > limits_.chunk_size) {
    throw Error::validation("chunk of " + std::to_string(chunk.size()) +
                            " bytes exceeds the chunk size limit of " +
                            std::to_string(limits_.chunk_size));
  }
  sessions_.writeChunk(session_id, offset, chunk);
}

FileRecord TransferEngine::finalize(const std::string& session_id) {
  std::shared_lock<std::shared_mutex> layout(layoutMu_);
  auto session = sessions_.beginClose(session_id);

  // Closing keeps writers out, so the ranges are stable from here on.
  if (!session->received.covers(0, session->expected_size)) {
    const auto have = session->received.coveredBytes();
    sessions_.reopen(session);
    throw Error::validation("incomplete upload: " + std::to_string(have) + " of " +
                            std::to_string(session->expected_size) + " bytes received");
  }

  const std::string ext = extensionOf(session->original_name);
  FileRecord rec;
  rec.id            = uuid4();
  rec.original_name = session->original_name;
  rec.stored_name   = storage_.allocate(session->original_name);
  rec.file_path     = storage_.storedPath(rec.stored_name);
  rec.file_size     = static_cast<int64_t>(session->expected_size);
  rec.mime_type     = mimeTypeForExtension(ext);
  rec.is_video      = isVideoExtension(ext) || rec.mime_type.rfind("video/", 0) == 0;

  // Phase 1: make the bytes durable, then move the temp file into place.
  try {
    std::error_code ec;
    const auto onDisk = fs::file_size(session->temp_path, ec);
    if (ec) throw Error::io("cannot stat " + session->temp_path + ": " + ec.message());
    if (onDisk != session->expected_size) {
      throw Error::io("temp file holds " + std::to_string(onDisk) + " bytes, expected " +
                      std::to_string(session->expected_size));
    }
    syncFile(session->temp_path);
    fs::rename(session->temp_path, rec.file_path, ec);
    if (ec) throw Error::io("rename to " + rec.file_path + " failed: " + ec.message());
  } catch (...) {
    sessions_.discard(session);
    throw;
  }

  // Phase 2: persist the rename, then publish the row. On failure the file
  // goes away again.
  rec.upload_time = nowMillis();
  try {
    syncDirectory(storage_.root());
    MetadataStore::Transaction tx(store_);
    store_.insertFile(rec);
    tx.commit();
  } catch (...) {
    std::error_code ec;
    fs::remove(rec.file_path, ec);
    if (ec) {
      spdlog::error("finalize {}: rollback could not delete {}: {}", session_id, rec.file_path,
                    ec.message());
    } else {
      spdlog::warn("finalize {}: insert failed, deleted {}", session_id, rec.file_path);
    }
    sessions_.release(session);
    throw;
  }

  sessions_.release(session);
  spdlog::info("upload {} finalized as {} ({}, {} bytes, {})", session_id, rec.id,
               rec.stored_name, rec.file_size, rec.mime_type);

  if (onFinalized_) {
    try {
      onFinalized_(rec);
    } catch (const std::exception& e) {
      spdlog::warn("finalize listener failed for {}: {}", rec.id, e.what());
    }
  }
  return rec;
}

void TransferEngine::abort(const std::string& session_id) {
  sessions_.abort(session_id);
}

SessionStatus TransferEngine::uploadStatus(const std::string& session_id) {
  return sessions_.status(session_id);
}

RangeReader TransferEngine::readRange(const std::string& id, uint64_t start,
                                      std::optional<uint64_t> end) {
  auto rec = store_.getFileById(id);
  if (!rec) throw Error::notFound("file not found: " + id);

  const auto size = static_cast<uint64_t>(rec->file_size);
  const uint64_t stop = end.value_or(size);
  if (stop > size || start > stop) {
    throw Error::validation("range [" + std::to_string(start) + ", " + std::to_string(stop) +
                            ") is outside file of " + std::to_string(size) + " bytes");
  }
  return RangeReader(rec->file_path, start, stop, static_cast<size_t>(limits_.chunk_size));
}

void TransferEngine::remove(const std::string& id) {
  std::shared_lock<std::shared_mutex> layout(layoutMu_);
  auto rec = store_.getFileById(id);
  if (!rec) throw Error::notFound("file not found: " + id);

  std::error_code ec;
  fs::remove(rec->file_path, ec);
  if (ec) throw Error::io("cannot delete " + rec->file_path + ": " + ec.message());

  if (rec->thumbnail_path) {
    fs::remove(*rec->thumbnail_path, ec);
    if (ec) spdlog::warn("cannot delete thumbnail {}: {}", *rec->thumbnail_path, ec.message());
  }

  if (!store_.deleteFile(id)) {
    spdlog::warn("file {} was already deleted concurrently", id);
  }
  spdlog::info("deleted file {} ({})", id, rec->stored_name);
}

std::optional<FileRecord> TransferEngine::getFile(const std::string& id) {
  return store_.getFileById(id);
}

std::vector<FileRecord> TransferEngine::listFiles(int limit, int offset, bool videosOnly) {
  return store_.listFiles(limit, offset, videosOnly);
}

StoreStats TransferEngine::stats() {
  return store_.stats();
}

size_t TransferEngine::expireStale(UploadSessionTracker::Clock::time_point now) {
  return sessions_.expireStale(now);
}

ReconcileReport TransferEngine::reconcile() {
  // Without the root lock another process may own the temp files and
  // half-committed files this sweep would delete.
  if (!storage_.ownsRoot()) {
    throw Error::conflict("reconcile requires the lock on storage root " + storage_.root());
  }
  std::unique_lock<std::shared_mutex> layout(layoutMu_);
  ReconcileReport report;

  std::unordered_set<std::string> storedNames;
  std::unordered_set<std::string> ids;
  std::vector<FileRecord> missing;
  for (int offset = 0;; offset += kReconcilePage) {
    auto page = store_.listFiles(kReconcilePage, offset);
    for (auto& rec : page) {
      std::error_code ec;
      const auto st = fs::status(rec.file_path, ec);
      if (st.type() == fs::file_type::not_found) {
        missing.push_back(std::move(rec));
        continue;
      }
      // only not_found condemns a row; other stat errors leave row and file be
      if (ec) {
        spdlog::warn("reconcile: cannot stat {} for row {}: {}, skipping", rec.file_path, rec.id,
                     ec.message());
      } else if (st.type() != fs::file_type::regular) {
        spdlog::warn("reconcile: {} for row {} is not a regular file, skipping", rec.file_path,
                     rec.id);
      }
      storedNames.insert(rec.stored_name);
      ids.insert(rec.id);
    }
    if (page.size() < static_cast<size_t>(kReconcilePage)) break;
  }

  for (const auto& rec : missing) {
    spdlog::warn("reconcile: row {} points at missing {}, deleting row", rec.id, rec.file_path);
    if (store_.deleteFile(rec.id)) ++report.orphan_rows;
  }

  auto sweepDir = [&](const std::string& dir, auto isOrphan, size_t& counter, const char* what) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      spdlog::warn("reconcile: cannot scan {}: {}", dir, ec.message());
      return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
      if (ec) break;
      std::error_code fec;
      if (!it->is_regular_file(fec)) continue;
      const std::string name = it->path().filename().string();
      if (!isOrphan(name)) continue;
      fs::remove(it->path(), fec);
      if (fec) {
        spdlog::warn("reconcile: cannot delete {} {}: {}", what, it->path().string(), fec.message());
      } else {
        spdlog::warn("reconcile: deleted {} {}", what, it->path().string());
        ++counter;
      }
    }
    if (ec) spdlog::warn("reconcile: scan of {} stopped early: {}", dir, ec.message());
  };

  sweepDir(storage_.root(),
           [&](const std::string& name) {
             return StorageAllocator::isStoredName(name) && !storedNames.count(name);
           },
           report.orphan_files, "orphan file");

  sweepDir(storage_.uploadsDir(),
           [&](const std::string& name) {
             if (!ends_with(name, kTempSuffix)) return true;
             return !sessions_.hasSession(name.substr(0, name.size() - std::string(kTempSuffix).size()));
           },
           report.stale_temp_files, "stale temp file");

  sweepDir(storage_.thumbnailsDir(),
           [&](const std::string& name) {
             return !ids.count(fs::path(name).stem().string());
           },
           report.orphan_thumbnails, "orphan thumbnail");

  if (report.total() > 0) {
    spdlog::info("reconcile: {} orphan files, {} orphan rows, {} stale temp files, {} orphan thumbnails",
                 report.orphan_files, report.orphan_rows, report.stale_temp_files,
                 report.orphan_thumbnails);
  }
  return report;
}

} // namespace ifs
