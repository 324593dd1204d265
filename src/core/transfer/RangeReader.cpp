#include "RangeReader.hpp"

#include <algorithm>

#include "core/Error.hpp"

namespace ifs {

RangeReader::RangeReader(const std::string& path, uint64_t start, uint64_t end, size_t bufferSize)
  : path_(path), in_(path, std::ios::binary), start_(start), end_(end), pos_(start),
    bufferSize_(bufferSize == 0 ? 1 : bufferSize) {
  if (!in_) throw Error::io("cannot open " + path);
  in_.seekg(static_cast<std::streamoff>(start));
  if (!in_) throw Error::io("cannot seek to " + std::to_string(start) + " in " + path);
}

bool RangeReader::next(std::string& out) {
  if (pos_ >= end_) return false;
  const size_t want = static_cast<size_t>(std::min<uint64_t>(bufferSize_, end_ - pos_));
  out.resize(want);
  in_.read(&out[0], static_cast<std::streamsize>(want));
  const auto got = static_cast<size_t>(in_.gcount());
  if (got == 0) throw Error::io("unexpected end of file in " + path_);
  out.resize(got);
  pos_ += got;
  return true;
}

} // namespace ifs
