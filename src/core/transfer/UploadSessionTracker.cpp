#include "UploadSessionTracker.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Error.hpp"
#include "core/storage/StorageAllocator.hpp"
#include "core/util/Ids.hpp"

namespace ifs {

namespace fs = std::filesystem;

namespace {

// Best effort; a temp file that is already gone is not worth reporting.
void remove_temp(const std::string& path, const std::string& why) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) spdlog::warn("{}: could not delete {}: {}", why, path, ec.message());
}

} // namespace

UploadSessionTracker::UploadSessionTracker(const StorageAllocator& storage,
                                           std::chrono::milliseconds timeout)
  : storage_(storage), timeout_(timeout) {}

UploadSessionTracker::~UploadSessionTracker() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& [sid, s] : sessions_) {
    std::lock_guard<std::mutex> slk(s->mu);
    if (s->state == SessionState::Open) {
      s->state = SessionState::Closed;
      remove_temp(s->temp_path, "shutdown");
    }
  }
  sessions_.clear();
}

std::string UploadSessionTracker::open(const std::string& original_name, uint64_t expected_size) {
  if (expected_size == 0) throw Error::validation("expected size must be positive");

  auto s = std::make_shared<UploadSession>();
  s->session_id       = uuid4();
  s->original_name    = original_name;
  s->expected_size    = expected_size;
  s->temp_path        = storage_.tempPath(s->session_id);
  s->created_at       = nowMillis();
  s->last_activity_at = Clock::now();

  {
    std::ofstream os(s->temp_path, std::ios::binary | std::ios::trunc);
    if (!os) throw Error::io("cannot create temp file " + s->temp_path);
  }

  std::lock_guard<std::mutex> lk(mu_);
  sessions_.emplace(s->session_id, s);
  spdlog::info("upload {} opened for '{}' ({} bytes)", s->session_id, original_name, expected_size);
  return s->session_id;
}

std::shared_ptr<UploadSession> UploadSessionTracker::find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) throw Error::notFound("upload session not found: " + session_id);
  return it->second;
}

void UploadSessionTracker::erase(const std::string& session_id) {
  std::lock_guard<std::mutex> lk(mu_);
  sessions_.erase(session_id);
}

void UploadSessionTracker::writeChunk(const std::string& session_id, uint64_t offset,
                                      std::string_view bytes) {
  auto s = find(session_id);
  std::lock_guard<std::mutex> slk(s->mu);

  // the session may have expired between find() and taking its lock
  if (s->state == SessionState::Closed) {
    throw Error::notFound("upload session not found: " + session_id);
  }
  if (s->state == SessionState::Closing) {
    throw Error::conflict("upload session " + session_id + " is being finalized");
  }
  if (bytes.empty()) throw Error::validation("empty chunk");
  if (offset > s->expected_size || bytes.size() > s->expected_size - offset) {
    throw Error::conflict("chunk [" + std::to_string(offset) + ", " +
                          std::to_string(offset + bytes.size()) +
                          ") runs past expected size " + std::to_string(s->expected_size));
  }

  std::fstream f(s->temp_path, std::ios::in | std::ios::out | std::ios::binary);
  if (!f) throw Error::io("cannot open temp file " + s->temp_path);
  f.seekp(static_cast<std::streamoff>(offset));
  f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  f.flush();
  if (!f) throw Error::io("write failed on " + s->temp_path);

  s->received.insert(offset, offset + bytes.size());
  s->last_activity_at = Clock::now();
  spdlog::debug("upload {}: wrote [{}, {}), {} of {} bytes received", session_id, offset,
                offset + bytes.size(), s->received.coveredBytes(), s->expected_size);
}

bool UploadSessionTracker::isComplete(const std::string& session_id) {
  auto s = find(session_id);
  std::lock_guard<std::mutex> slk(s->mu);
  return s->received.covers(0, s->expected_size);
}

SessionStatus UploadSessionTracker::status(const std::string& session_id) {
  auto s = find(session_id);
  std::lock_guard<std::mutex> slk(s->mu);
  SessionStatus out;
  out.session_id     = s->session_id;
  out.original_name  = s->original_name;
  out.expected_size  = s->expected_size;
  out.received_bytes = s->received.coveredBytes();
  out.next_offset    = s->received.firstGap(s->expected_size);
  out.complete       = s->received.covers(0, s->expected_size);
  out.ranges         = s->received.ranges();
  out.created_at     = s->created_at;
  auto left = timeout_ - std::chrono::duration_cast<std::chrono::milliseconds>(
                           Clock::now() - s->last_activity_at);
  out.expires_in_ms  = left.count() > 0 ? left.count() : 0;
  return out;
}

size_t UploadSessionTracker::expireStale(Clock::time_point now) {
  std::vector<std::shared_ptr<UploadSession>> expired;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      auto& s = it->second;
      std::unique_lock<std::mutex> slk(s->mu, std::try_to_lock);
      // busy with a chunk write, so not idle
      if (!slk.owns_lock() || s->state != SessionState::Open || now - s->last_activity_at <= timeout_) {
        ++it;
        continue;
      }
      s->state = SessionState::Closed;
      expired.push_back(s);
      slk.unlock();
      it = sessions_.erase(it);
    }
  }

  for (const auto& s : expired) {
    spdlog::info("upload {} expired after {} ms idle ({} of {} bytes received)", s->session_id,
                 timeout_.count(), s->received.coveredBytes(), s->expected_size);
    remove_temp(s->temp_path, "expiry sweep");
  }
  return expired.size();
}

void UploadSessionTracker::abort(const std::string& session_id) {
  auto s = find(session_id);
  {
    std::lock_guard<std::mutex> slk(s->mu);
    if (s->state == SessionState::Closed) {
      throw Error::notFound("upload session not found: " + session_id);
    }
    if (s->state == SessionState::Closing) {
      throw Error::conflict("upload session " + session_id + " is being finalized");
    }
    s->state = SessionState::Closed;
  }
  erase(session_id);

  std::error_code ec;
  fs::remove(s->temp_path, ec);
  spdlog::info("upload {} aborted", session_id);
  if (ec) throw Error::io("cannot delete temp file " + s->temp_path + ": " + ec.message());
}

std::shared_ptr<UploadSession> UploadSessionTracker::beginClose(const std::string& session_id) {
  auto s = find(session_id);
  std::lock_guard<std::mutex> slk(s->mu);
  if (s->state == SessionState::Closed) {
    throw Error::notFound("upload session not found: " + session_id);
  }
  if (s->state == SessionState::Closing) {
    throw Error::conflict("upload session " + session_id + " is already being finalized");
  }
  s->state = SessionState::Closing;
  return s;
}

void UploadSessionTracker::reopen(const std::shared_ptr<UploadSession>& session) {
  std::lock_guard<std::mutex> slk(session->mu);
  if (session->state == SessionState::Closing) {
    session->state = SessionState::Open;
    session->last_activity_at = Clock::now();
  }
}

void UploadSessionTracker::release(const std::shared_ptr<UploadSession>& session) {
  {
    std::lock_guard<std::mutex> slk(session->mu);
    session->state = SessionState::Closed;
  }
  erase(session->session_id);
}

void UploadSessionTracker::discard(const std::shared_ptr<UploadSession>& session) {
  release(session);
  remove_temp(session->temp_path, "discard upload " + session->session_id);
}

bool UploadSessionTracker::hasSession(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.count(session_id) > 0;
}

size_t UploadSessionTracker::activeCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

} // namespace ifs
