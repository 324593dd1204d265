#pragma once
#include <cstdint>
#include <fstream>
#include <string>

namespace ifs {

// Lazy reader over [start, end) of a finalized file. Each next() reads at
// most bufferSize bytes, so memory use does not depend on the file size.
// Not resumable: a broken transfer starts over with a new readRange().
class RangeReader {
public:
  RangeReader(const std::string& path, uint64_t start, uint64_t end, size_t bufferSize);

  RangeReader(RangeReader&&) = default;
  RangeReader& operator=(RangeReader&&) = default;

  // Replaces out with the next piece; false once the range is exhausted.
  bool next(std::string& out);

  uint64_t start() const     { return start_; }
  uint64_t end() const       { return end_; }
  uint64_t length() const    { return end_ - start_; }
  uint64_t remaining() const { return end_ - pos_; }

private:
  std::string   path_;
  std::ifstream in_;
  uint64_t      start_;
  uint64_t      end_;
  uint64_t      pos_;
  size_t        bufferSize_;
};

} // namespace ifs
