#include "FileSync.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include "core/Error.hpp"

namespace ifs {

namespace {

void sync_fd(const std::string& path, int flags, const char* what) {
  const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    throw Error::io(std::string("cannot open ") + what + " " + path + ": " + std::strerror(errno));
  }
  if (::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    throw Error::io("fsync of " + path + " failed: " + std::strerror(err));
  }
  if (::close(fd) != 0) {
    throw Error::io("close of " + path + " failed: " + std::strerror(errno));
  }
}

} // namespace

void syncFile(const std::string& path) {
  sync_fd(path, O_RDONLY, "file");
}

void syncDirectory(const std::string& path) {
  sync_fd(path, O_RDONLY | O_DIRECTORY, "directory");
}

} // namespace ifs
