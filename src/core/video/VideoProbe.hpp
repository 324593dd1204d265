#pragma once
#include <string>

#include "core/metadata/MetadataStore.hpp"

namespace ifs {

// Extracts duration, resolution and a thumbnail from a finalized video.
// Throws ifs::Error when the file cannot be probed.
class VideoProbe {
public:
  virtual ~VideoProbe() = default;
  virtual VideoMetadata probe(const std::string& filePath, const std::string& thumbnailPath) = 0;
};

// Shells out to ffprobe / ffmpeg.
class FfmpegVideoProbe : public VideoProbe {
public:
  FfmpegVideoProbe(std::string ffprobe, std::string ffmpeg, std::string thumbnailSize);

  VideoMetadata probe(const std::string& filePath, const std::string& thumbnailPath) override;

  // Parses `ffprobe -of json` output into duration and "WxH".
  static VideoMetadata parseProbeOutput(const std::string& json);

private:
  bool makeThumbnail(const std::string& filePath, const std::string& thumbnailPath,
                     const char* seekTo) const;

  std::string ffprobe_;
  std::string ffmpeg_;
  std::string scale_; // "320:240"
};

// Single-quotes an argument for /bin/sh.
std::string shellQuote(const std::string& arg);

} // namespace ifs
