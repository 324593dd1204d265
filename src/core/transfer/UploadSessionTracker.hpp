#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/transfer/RangeSet.hpp"

namespace ifs {

class StorageAllocator;

enum class SessionState {
  Open,     // accepting chunks
  Closing,  // finalize in progress; chunks and sweeps keep out
  Closed    // finalized, aborted or expired; temp file is gone or owned elsewhere
};

struct UploadSession {
  using Clock = std::chrono::steady_clock;

  std::string session_id;
  std::string original_name;
  uint64_t    expected_size = 0;
  std::string temp_path;

  RangeSet received;

  int64_t           created_at = 0; // epoch millis
  Clock::time_point last_activity_at;
  SessionState      state = SessionState::Open;

  // Serializes writes and range merges for this one session.
  std::mutex mu;
};

struct SessionStatus {
  std::string session_id;
  std::string original_name;
  uint64_t    expected_size = 0;
  uint64_t    received_bytes = 0;
  uint64_t    next_offset = 0;  // first byte the client still has to send
  bool        complete = false;
  std::vector<RangeSet::Range> ranges;
  int64_t     created_at = 0;
  int64_t     expires_in_ms = 0;
};

// Registry of in-progress uploads. Owns every UploadSession; callers only get
// short-lived shared_ptrs through beginClose().
class UploadSessionTracker {
public:
  using Clock = UploadSession::Clock;

  UploadSessionTracker(const StorageAllocator& storage, std::chrono::milliseconds timeout);
  ~UploadSessionTracker();

  UploadSessionTracker(const UploadSessionTracker&) = delete;
  UploadSessionTracker& operator=(const UploadSessionTracker&) = delete;

  // Creates an empty temp file and returns the new session id.
  std::string open(const std::string& original_name, uint64_t expected_size);

  // Writes bytes at offset and merges [offset, offset + size) into the
  // received ranges. Overlaps and out-of-order chunks are fine; a chunk that
  // would run past expected_size is a Conflict.
  void writeChunk(const std::string& session_id, uint64_t offset, std::string_view bytes);

  bool isComplete(const std::string& session_id);

  SessionStatus status(const std::string& session_id);

  // Drops sessions idle for longer than the timeout and deletes their temp
  // files. Sessions that are closing or mid-write are skipped. Returns the
  // number of sessions expired.
  size_t expireStale(Clock::time_point now = Clock::now());

  void abort(const std::string& session_id);

  // Finalize protocol: beginClose() moves the session to Closing, after which
  // exactly one of reopen(), release() or discard() must follow.
  std::shared_ptr<UploadSession> beginClose(const std::string& session_id);
  void reopen(const std::shared_ptr<UploadSession>& session);
  void release(const std::shared_ptr<UploadSession>& session);
  void discard(const std::shared_ptr<UploadSession>& session);

  bool hasSession(const std::string& session_id) const;
  size_t activeCount() const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::shared_ptr<UploadSession> find(const std::string& session_id) const;
  void erase(const std::string& session_id);

  const StorageAllocator& storage_;
  std::chrono::milliseconds timeout_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
};

} // namespace ifs
