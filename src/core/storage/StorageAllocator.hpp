#pragma once
#include <string>

namespace ifs {

// Maps client file names onto collision-free names under the storage root.
//
// Layout:
//   <root>/<uuid>[.<ext>]          finalized files
//   <root>/.uploads/<sid>.part     in-progress uploads
//   <root>/.thumbnails/<id>.jpg    video thumbnails
//   <root>/.lock                   held by the process that owns the root
//
// Temp files live under the root so the finalize rename never crosses a
// filesystem boundary.
class StorageAllocator {
public:
  explicit StorageAllocator(std::string root) : root_(std::move(root)) {}
  ~StorageAllocator();

  StorageAllocator(const StorageAllocator&) = delete;
  StorageAllocator& operator=(const StorageAllocator&) = delete;

  // Creates the directory tree, probes that it is writable and takes an
  // exclusive lock on the root for the life of this object. Throws
  // PermissionDenied when the root is unusable and Conflict when another
  // process holds the lock. Call once at startup.
  void ensureWritable();

  bool ownsRoot() const { return lockFd_ >= 0; }

  // "<uuid>.<ext>" or "<uuid>" when the name carries no usable extension.
  std::string allocate(const std::string& original_name) const;

  // True for names allocate() can produce. Anything else in the root (a
  // database someone put there, editor droppings) is never treated as ours.
  static bool isStoredName(const std::string& name);

  std::string storedPath(const std::string& stored_name) const;
  std::string tempPath(const std::string& session_id) const;
  std::string thumbnailPath(const std::string& file_id) const;

  const std::string& root() const { return root_; }
  std::string uploadsDir() const;
  std::string thumbnailsDir() const;

private:
  std::string root_;
  int lockFd_ = -1;
};

} // namespace ifs
