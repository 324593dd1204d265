// Tests for the SQLite-backed file table

#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/Error.hpp"

using namespace ifs;
using namespace ifs::test;

class MetadataStoreTest : public ::testing::Test {
protected:
  ScratchDir dir;
  std::string dbPath = (dir.path / "files.db").string();
  std::unique_ptr<MetadataStore> store;

  void SetUp() override {
    initDatabase(dbPath, IFS_SCHEMA_PATH);
    store = std::make_unique<MetadataStore>(dbPath);
  }
};

TEST_F(MetadataStoreTest, InitIsIdempotent) {
  EXPECT_TRUE(initDatabase(dbPath, IFS_SCHEMA_PATH));
  EXPECT_TRUE(initDatabase(dbPath, IFS_SCHEMA_PATH));
}

TEST_F(MetadataStoreTest, InsertAndGetById) {
  auto r = makeRecord("a.txt", 42, 1000);
  r.video_resolution = "640x480";
  store->insertFile(r);

  auto got = store->getFileById(r.id);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->stored_name, "a.txt");
  EXPECT_EQ(got->original_name, r.original_name);
  EXPECT_EQ(got->file_size, 42);
  EXPECT_EQ(got->upload_time, 1000);
  EXPECT_FALSE(got->is_video);
  EXPECT_FALSE(got->thumbnail_path.has_value());
  EXPECT_FALSE(got->video_duration.has_value());
  EXPECT_EQ(got->video_resolution.value_or(""), "640x480");
}

TEST_F(MetadataStoreTest, GetMissingReturnsNone) {
  EXPECT_FALSE(store->getFileById("does-not-exist").has_value());
}

TEST_F(MetadataStoreTest, DuplicateIdIsConflict) {
  auto r = makeRecord("a.txt", 1, 1);
  store->insertFile(r);
  auto dup = makeRecord("b.txt", 1, 1);
  dup.id = r.id;
  try {
    store->insertFile(dup);
    FAIL() << "expected Conflict";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Conflict);
  }
}

TEST_F(MetadataStoreTest, DuplicateStoredNameIsConflict) {
  store->insertFile(makeRecord("same.bin", 1, 1));
  try {
    store->insertFile(makeRecord("same.bin", 2, 2));
    FAIL() << "expected Conflict";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Conflict);
  }
  EXPECT_EQ(store->stats().total_files, 1);
}

TEST_F(MetadataStoreTest, ListIsNewestFirstAndPaginates) {
  for (int i = 0; i < 5; ++i) {
    store->insertFile(makeRecord("f" + std::to_string(i), i, 1000 + i));
  }
  auto first = store->listFiles(2, 0);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].stored_name, "f4");
  EXPECT_EQ(first[1].stored_name, "f3");

  auto rest = store->listFiles(10, 2);
  ASSERT_EQ(rest.size(), 3u);
  EXPECT_EQ(rest[2].stored_name, "f0");

  EXPECT_TRUE(store->listFiles(10, 5).empty());
  EXPECT_EQ(store->listFiles().size(), 5u);
}

TEST_F(MetadataStoreTest, SameTimestampKeepsInsertionOrder) {
  store->insertFile(makeRecord("first", 1, 500));
  store->insertFile(makeRecord("second", 1, 500));
  auto rows = store->listFiles();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].stored_name, "second");
}

TEST_F(MetadataStoreTest, ListRejectsBadPaging) {
  EXPECT_THROW(store->listFiles(0, 0), Error);
  EXPECT_THROW(store->listFiles(10, -1), Error);
}

TEST_F(MetadataStoreTest, ListVideosOnly) {
  store->insertFile(makeRecord("a.mp4", 1, 1, true));
  store->insertFile(makeRecord("b.txt", 1, 2));
  auto vids = store->listFiles(50, 0, true);
  ASSERT_EQ(vids.size(), 1u);
  EXPECT_EQ(vids[0].stored_name, "a.mp4");
}

TEST_F(MetadataStoreTest, DeleteReportsExistence) {
  auto r = makeRecord("x", 1, 1);
  store->insertFile(r);
  EXPECT_TRUE(store->deleteFile(r.id));
  EXPECT_FALSE(store->deleteFile(r.id));
  EXPECT_FALSE(store->getFileById(r.id).has_value());
}

TEST_F(MetadataStoreTest, StatsOnEmptyTable) {
  auto s = store->stats();
  EXPECT_EQ(s.total_files, 0);
  EXPECT_EQ(s.total_size, 0);
  EXPECT_EQ(s.video_count, 0);
}

TEST_F(MetadataStoreTest, StatsAggregates) {
  store->insertFile(makeRecord("a", 100, 1));
  store->insertFile(makeRecord("b", 200, 2));
  store->insertFile(makeRecord("c.mp4", 300, 3, true));
  auto s = store->stats();
  EXPECT_EQ(s.total_files, 3);
  EXPECT_EQ(s.total_size, 600);
  EXPECT_EQ(s.video_count, 1);
}

TEST_F(MetadataStoreTest, UpdateVideoMetadata) {
  auto r = makeRecord("v.mp4", 10, 1, true);
  store->insertFile(r);
  VideoMetadata v;
  v.duration = 12.5;
  v.resolution = "1920x1080";
  v.thumbnail_path = "/tmp/thumb.jpg";
  EXPECT_TRUE(store->updateVideoMetadata(r.id, v));
  EXPECT_FALSE(store->updateVideoMetadata("missing", v));

  auto got = store->getFileById(r.id);
  ASSERT_TRUE(got.has_value());
  EXPECT_DOUBLE_EQ(got->video_duration.value_or(0), 12.5);
  EXPECT_EQ(got->video_resolution.value_or(""), "1920x1080");
  EXPECT_EQ(got->thumbnail_path.value_or(""), "/tmp/thumb.jpg");
}

TEST_F(MetadataStoreTest, TransactionRollsBackWithoutCommit) {
  auto r = makeRecord("tx", 1, 1);
  {
    MetadataStore::Transaction tx(*store);
    store->insertFile(r);
  }
  EXPECT_FALSE(store->getFileById(r.id).has_value());

  {
    MetadataStore::Transaction tx(*store);
    store->insertFile(r);
    tx.commit();
  }
  EXPECT_TRUE(store->getFileById(r.id).has_value());
}

TEST(MetadataStoreOpenTest, MissingDatabaseIsPersistenceFailure) {
  ScratchDir dir;
  try {
    MetadataStore store((dir.path / "nope" / "files.db").string());
    FAIL() << "expected PersistenceFailure";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::PersistenceFailure);
  }
}
