#include "StorageAllocator.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "core/Error.hpp"
#include "core/util/Ids.hpp"
#include "core/util/MimeTypes.hpp"

namespace ifs {

namespace fs = std::filesystem;

StorageAllocator::~StorageAllocator() {
  if (lockFd_ >= 0) {
    ::flock(lockFd_, LOCK_UN);
    ::close(lockFd_);
  }
}

void StorageAllocator::ensureWritable() {
  std::error_code ec;
  for (const auto& dir : {root_, uploadsDir(), thumbnailsDir()}) {
    fs::create_directories(dir, ec);
    if (ec) throw Error::permission("cannot create " + dir + ": " + ec.message());
  }
  const fs::path probe = fs::path(uploadsDir()) / (".probe-" + uuid4());
  {
    std::ofstream os(probe, std::ios::binary);
    os << "ok";
    os.flush();
    if (!os) throw Error::permission("storage root is not writable: " + root_);
  }
  fs::remove(probe, ec);
  if (ec) throw Error::permission("cannot remove probe file in " + root_ + ": " + ec.message());

  if (lockFd_ >= 0) return;
  const std::string lockPath = (fs::path(root_) / ".lock").string();
  const int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) throw Error::permission("cannot open " + lockPath + ": " + std::strerror(errno));
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      throw Error::conflict("storage root " + root_ + " is in use by another process");
    }
    throw Error::permission("cannot lock " + lockPath + ": " + std::strerror(err));
  }
  lockFd_ = fd;
}

std::string StorageAllocator::allocate(const std::string& original_name) const {
  const std::string ext = extensionOf(original_name);
  return ext.empty() ? uuid4() : uuid4() + "." + ext;
}

bool StorageAllocator::isStoredName(const std::string& name) {
  // 8-4-4-4-12 lower-case hex, then nothing or ".<ext>"
  constexpr size_t kUuidLen = 36;
  if (name.size() < kUuidLen) return false;
  for (size_t i = 0; i < kUuidLen; ++i) {
    const char c = name[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
    } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  if (name.size() == kUuidLen) return true;
  return name[kUuidLen] == '.' && extensionOf(name) == name.substr(kUuidLen + 1);
}

std::string StorageAllocator::storedPath(const std::string& stored_name) const {
  return (fs::path(root_) / stored_name).string();
}

std::string StorageAllocator::tempPath(const std::string& session_id) const {
  return (fs::path(uploadsDir()) / (session_id + ".part")).string();
}

std::string StorageAllocator::thumbnailPath(const std::string& file_id) const {
  return (fs::path(thumbnailsDir()) / (file_id + ".jpg")).string();
}

std::string StorageAllocator::uploadsDir() const {
  return (fs::path(root_) / ".uploads").string();
}

std::string StorageAllocator::thumbnailsDir() const {
  return (fs::path(root_) / ".thumbnails").string();
}

} // namespace ifs
