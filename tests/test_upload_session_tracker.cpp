// Tests for the in-progress upload registry

#include <gtest/gtest.h>

#include <functional>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "core/Error.hpp"
#include "core/transfer/UploadSessionTracker.hpp"

using namespace ifs;
using namespace ifs::test;
using namespace std::chrono_literals;

class UploadSessionTrackerTest : public ::testing::Test {
protected:
  ScratchDir dir;
  StorageAllocator storage{(dir.path / "storage").string()};
  std::unique_ptr<UploadSessionTracker> tracker;

  void SetUp() override {
    storage.ensureWritable();
    tracker = std::make_unique<UploadSessionTracker>(storage, 200ms);
  }

  static ErrorKind kindOf(const std::function<void()>& fn) {
    try {
      fn();
    } catch (const Error& e) {
      return e.kind();
    }
    ADD_FAILURE() << "no ifs::Error thrown";
    return ErrorKind::IOFailure;
  }
};

TEST_F(UploadSessionTrackerTest, OpenCreatesEmptyTempFile) {
  auto sid = tracker->open("a.bin", 10);
  EXPECT_TRUE(tracker->hasSession(sid));
  EXPECT_TRUE(fs::exists(storage.tempPath(sid)));
  EXPECT_EQ(fs::file_size(storage.tempPath(sid)), 0u);
  EXPECT_FALSE(tracker->isComplete(sid));
}

TEST_F(UploadSessionTrackerTest, OutOfOrderOverlappingChunksComplete) {
  const std::string data = "0123456789abcdefghij";
  auto sid = tracker->open("a.bin", data.size());
  tracker->writeChunk(sid, 10, std::string_view(data).substr(10, 10));
  tracker->writeChunk(sid, 0, std::string_view(data).substr(0, 6));
  EXPECT_FALSE(tracker->isComplete(sid));
  // retry overlapping both received ranges
  tracker->writeChunk(sid, 4, std::string_view(data).substr(4, 8));
  EXPECT_TRUE(tracker->isComplete(sid));
  EXPECT_EQ(readFile(storage.tempPath(sid)), data);
}

TEST_F(UploadSessionTrackerTest, StatusReportsResumeOffset) {
  auto sid = tracker->open("a.bin", 100);
  tracker->writeChunk(sid, 0, std::string(40, 'x'));
  tracker->writeChunk(sid, 60, std::string(10, 'y'));
  auto st = tracker->status(sid);
  EXPECT_EQ(st.expected_size, 100u);
  EXPECT_EQ(st.received_bytes, 50u);
  EXPECT_EQ(st.next_offset, 40u);
  EXPECT_FALSE(st.complete);
  ASSERT_EQ(st.ranges.size(), 2u);
  EXPECT_EQ(st.ranges[1], (RangeSet::Range{60, 70}));
  EXPECT_GT(st.expires_in_ms, 0);
}

TEST_F(UploadSessionTrackerTest, UnknownSessionIsNotFound) {
  EXPECT_EQ(kindOf([&] { tracker->writeChunk("nope", 0, "x"); }), ErrorKind::NotFound);
  EXPECT_EQ(kindOf([&] { tracker->isComplete("nope"); }), ErrorKind::NotFound);
  EXPECT_EQ(kindOf([&] { tracker->abort("nope"); }), ErrorKind::NotFound);
}

TEST_F(UploadSessionTrackerTest, WritePastExpectedSizeIsConflict) {
  auto sid = tracker->open("a.bin", 10);
  EXPECT_EQ(kindOf([&] { tracker->writeChunk(sid, 8, "abc"); }), ErrorKind::Conflict);
  EXPECT_EQ(kindOf([&] { tracker->writeChunk(sid, 11, "a"); }), ErrorKind::Conflict);
  // the exact tail is fine
  tracker->writeChunk(sid, 8, "ab");
  EXPECT_EQ(tracker->status(sid).received_bytes, 2u);
}

TEST_F(UploadSessionTrackerTest, EmptyChunkIsValidation) {
  auto sid = tracker->open("a.bin", 10);
  EXPECT_EQ(kindOf([&] { tracker->writeChunk(sid, 0, ""); }), ErrorKind::Validation);
}

TEST_F(UploadSessionTrackerTest, AbortDeletesTempFile) {
  auto sid = tracker->open("a.bin", 10);
  tracker->writeChunk(sid, 0, "abc");
  tracker->abort(sid);
  EXPECT_FALSE(tracker->hasSession(sid));
  EXPECT_FALSE(fs::exists(storage.tempPath(sid)));
  EXPECT_EQ(kindOf([&] { tracker->writeChunk(sid, 3, "d"); }), ErrorKind::NotFound);
}

TEST_F(UploadSessionTrackerTest, SweepExpiresIdleSessions) {
  auto idle = tracker->open("idle.bin", 10);
  auto busy = tracker->open("busy.bin", 10);

  std::this_thread::sleep_for(150ms);
  tracker->writeChunk(busy, 0, "x");

  const auto later = UploadSessionTracker::Clock::now() + 100ms;
  EXPECT_EQ(tracker->expireStale(later), 1u);
  EXPECT_FALSE(tracker->hasSession(idle));
  EXPECT_FALSE(fs::exists(storage.tempPath(idle)));
  EXPECT_TRUE(tracker->hasSession(busy));
  EXPECT_TRUE(fs::exists(storage.tempPath(busy)));
}

TEST_F(UploadSessionTrackerTest, SweepSkipsClosingSessions) {
  auto sid = tracker->open("a.bin", 1);
  tracker->writeChunk(sid, 0, "a");
  auto session = tracker->beginClose(sid);

  EXPECT_EQ(tracker->expireStale(UploadSessionTracker::Clock::now() + 1h), 0u);
  EXPECT_TRUE(tracker->hasSession(sid));
  EXPECT_EQ(kindOf([&] { tracker->writeChunk(sid, 0, "a"); }), ErrorKind::Conflict);
  EXPECT_EQ(kindOf([&] { tracker->beginClose(sid); }), ErrorKind::Conflict);
  EXPECT_EQ(kindOf([&] { tracker->abort(sid); }), ErrorKind::Conflict);

  tracker->reopen(session);
  tracker->writeChunk(sid, 0, "a");
  EXPECT_EQ(tracker->expireStale(UploadSessionTracker::Clock::now() + 1h), 1u);
}

TEST_F(UploadSessionTrackerTest, SweepToleratesMissingTempFile) {
  auto sid = tracker->open("a.bin", 10);
  fs::remove(storage.tempPath(sid));
  EXPECT_EQ(tracker->expireStale(UploadSessionTracker::Clock::now() + 1h), 1u);
  EXPECT_EQ(tracker->activeCount(), 0u);
}

TEST_F(UploadSessionTrackerTest, DistinctSessionsDoNotInterfere) {
  const std::string a = makePayload(64 * 1024);
  const std::string b = makePayload(96 * 1024).substr(7);
  auto sa = tracker->open("a.bin", a.size());
  auto sb = tracker->open("b.bin", b.size());

  auto feed = [&](const std::string& sid, const std::string& data) {
    for (size_t off = 0; off < data.size(); off += 1000) {
      tracker->writeChunk(sid, off, std::string_view(data).substr(off, 1000));
    }
  };
  std::thread ta(feed, sa, a);
  std::thread tb(feed, sb, b);
  ta.join();
  tb.join();

  auto stA = tracker->status(sa);
  auto stB = tracker->status(sb);
  EXPECT_EQ(stA.ranges, (std::vector<RangeSet::Range>{{0, a.size()}}));
  EXPECT_EQ(stB.ranges, (std::vector<RangeSet::Range>{{0, b.size()}}));
  EXPECT_EQ(readFile(storage.tempPath(sa)), a);
  EXPECT_EQ(readFile(storage.tempPath(sb)), b);
}

TEST_F(UploadSessionTrackerTest, ConcurrentWritesToOneSessionMergeCorrectly) {
  const std::string data = makePayload(40000);
  auto sid = tracker->open("one.bin", data.size());
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (size_t off = t * 1000; off < data.size(); off += 4000) {
        tracker->writeChunk(sid, off, std::string_view(data).substr(off, 1000));
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_TRUE(tracker->isComplete(sid));
  EXPECT_EQ(readFile(storage.tempPath(sid)), data);
}
