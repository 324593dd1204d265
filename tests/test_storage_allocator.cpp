// Tests for stored-name allocation and path layout

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "core/Error.hpp"
#include "core/util/FileSync.hpp"
#include "core/util/MimeTypes.hpp"

using namespace ifs;
using namespace ifs::test;

TEST(StorageAllocatorTest, KeepsExtension) {
  StorageAllocator a("/srv/files");
  auto name = a.allocate("Holiday Movie.MP4");
  EXPECT_EQ(name.size(), 36u + 4u);
  EXPECT_EQ(name.substr(36), ".mp4");
  EXPECT_TRUE(StorageAllocator::isStoredName(name));
}

TEST(StorageAllocatorTest, BareTokenWithoutExtension) {
  StorageAllocator a("/srv/files");
  EXPECT_EQ(a.allocate("README").size(), 36u);
  EXPECT_EQ(a.allocate(".bashrc").size(), 36u);
  EXPECT_EQ(a.allocate("weird.").size(), 36u);
  EXPECT_EQ(a.allocate("bad.ext with space").size(), 36u);
}

TEST(StorageAllocatorTest, PathsJoinRoot) {
  StorageAllocator a("/srv/files");
  EXPECT_EQ(a.storedPath("abc.mp4"), "/srv/files/abc.mp4");
  EXPECT_EQ(a.tempPath("s1"), "/srv/files/.uploads/s1.part");
  EXPECT_EQ(a.thumbnailPath("f1"), "/srv/files/.thumbnails/f1.jpg");
}

TEST(StorageAllocatorTest, ConcurrentAllocationsAreDistinct) {
  StorageAllocator a("/srv/files");
  std::set<std::string> names;
  std::mutex mu;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < 125; ++i) local.push_back(a.allocate("movie.mp4"));
      std::lock_guard<std::mutex> lk(mu);
      names.insert(local.begin(), local.end());
    });
  }
  for (auto& t : threads) t.join();

  ASSERT_EQ(names.size(), 1000u);
  for (const auto& n : names) {
    EXPECT_EQ(n.substr(n.size() - 4), ".mp4");
  }
}

TEST(StorageAllocatorTest, IsStoredNameRejectsForeignFiles) {
  EXPECT_FALSE(StorageAllocator::isStoredName("files.db"));
  EXPECT_FALSE(StorageAllocator::isStoredName("files.db-wal"));
  EXPECT_FALSE(StorageAllocator::isStoredName("0123456789abcdef0123456789abcdef0123"));
  EXPECT_TRUE(StorageAllocator::isStoredName("01234567-89ab-4def-8123-456789abcdef"));
  EXPECT_FALSE(StorageAllocator::isStoredName("01234567-89AB-4def-8123-456789abcdef"));
}

TEST(StorageAllocatorTest, EnsureWritableCreatesLayout) {
  ScratchDir dir;
  StorageAllocator a((dir.path / "root").string());
  a.ensureWritable();
  EXPECT_TRUE(fs::is_directory(a.uploadsDir()));
  EXPECT_TRUE(fs::is_directory(a.thumbnailsDir()));
  EXPECT_EQ(std::distance(fs::directory_iterator(a.uploadsDir()), fs::directory_iterator()), 0);
}

TEST(StorageAllocatorTest, EnsureWritableFailsUnderAFile) {
  ScratchDir dir;
  writeFile(dir.path / "plain", "x");
  StorageAllocator a((dir.path / "plain" / "root").string());
  try {
    a.ensureWritable();
    FAIL() << "expected PermissionDenied";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::PermissionDenied);
  }
}

TEST(StorageAllocatorTest, SecondOwnerOfRootIsConflict) {
  ScratchDir dir;
  const std::string root = (dir.path / "root").string();
  StorageAllocator first(root);
  first.ensureWritable();
  EXPECT_TRUE(first.ownsRoot());
  EXPECT_TRUE(fs::exists(fs::path(root) / ".lock"));

  StorageAllocator second(root);
  try {
    second.ensureWritable();
    FAIL() << "expected Conflict";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Conflict);
  }
  EXPECT_FALSE(second.ownsRoot());
}

TEST(StorageAllocatorTest, RootLockIsReleasedOnDestruction) {
  ScratchDir dir;
  const std::string root = (dir.path / "root").string();
  {
    StorageAllocator first(root);
    first.ensureWritable();
  }
  StorageAllocator second(root);
  second.ensureWritable();
  EXPECT_TRUE(second.ownsRoot());
  EXPECT_FALSE(StorageAllocator::isStoredName(".lock"));
}

TEST(FileSyncTest, SyncsFilesAndDirectories) {
  ScratchDir dir;
  writeFile(dir.path / "a.bin", "payload");
  syncFile((dir.path / "a.bin").string());
  syncDirectory(dir.path.string());
  EXPECT_EQ(readFile(dir.path / "a.bin"), "payload");
}

TEST(FileSyncTest, MissingPathIsIOFailure) {
  ScratchDir dir;
  try {
    syncFile((dir.path / "missing").string());
    FAIL() << "expected IOFailure";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
  }
  writeFile(dir.path / "plain", "x");
  try {
    syncDirectory((dir.path / "plain").string());
    FAIL() << "expected IOFailure";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
  }
}

TEST(MimeTypesTest, ContentDispositionEscapesName) {
  EXPECT_EQ(contentDisposition("report.pdf", false),
            "attachment; filename=\"report.pdf\"; filename*=UTF-8''report.pdf");
  EXPECT_EQ(contentDisposition("a\"b\\c d.txt", true),
            "inline; filename=\"a_b_c d.txt\"; filename*=UTF-8''a%22b%5Cc%20d.txt");
  EXPECT_EQ(contentDisposition("caf\xc3\xa9\r\n.mp4", false),
            "attachment; filename=\"caf____.mp4\"; filename*=UTF-8''caf%C3%A9%0D%0A.mp4");
}

TEST(MimeTypesTest, ExtensionAndType) {
  EXPECT_EQ(extensionOf("clip.MKV"), "mkv");
  EXPECT_EQ(extensionOf("dir.v2/file"), "");
  EXPECT_EQ(extensionOf("archive.tar.gz"), "gz");
  EXPECT_EQ(mimeTypeForExtension("mp4"), "video/mp4");
  EXPECT_EQ(mimeTypeForExtension("pdf"), "application/pdf");
  EXPECT_EQ(mimeTypeForExtension("nope"), "application/octet-stream");
}
