#include "VideoProbe.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sys/wait.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Error.hpp"

using nlohmann::json;

namespace ifs {

namespace {

// Runs cmd, returns stdout; throws unless it exits with status 0.
std::string run_capture(const std::string& cmd) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw Error::io("cannot run: " + cmd);
  std::string out;
  char buffer[4096];
  size_t n;
  while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) out.append(buffer, n);
  int status = pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw Error::io("command failed (status " + std::to_string(status) + "): " + cmd);
  }
  return out;
}

} // namespace

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

FfmpegVideoProbe::FfmpegVideoProbe(std::string ffprobe, std::string ffmpeg, std::string thumbnailSize)
  : ffprobe_(std::move(ffprobe)), ffmpeg_(std::move(ffmpeg)), scale_(std::move(thumbnailSize)) {
  auto x = scale_.find('x');
  if (x != std::string::npos) scale_[x] = ':';
}

VideoMetadata FfmpegVideoProbe::parseProbeOutput(const std::string& text) {
  VideoMetadata out;
  try {
    auto j = json::parse(text);
    if (!j.contains("streams") || !j["streams"].is_array() || j["streams"].empty()) {
      throw Error::io("no video stream found");
    }
    const auto& s = j["streams"][0];
    out.resolution = std::to_string(s.value("width", 0)) + "x" + std::to_string(s.value("height", 0));
    if (j.contains("format") && j["format"].contains("duration")) {
      const auto& d = j["format"]["duration"];
      // ffprobe prints numbers as strings in its JSON writer
      out.duration = d.is_string() ? std::stod(d.get<std::string>()) : d.get<double>();
    }
  } catch (const json::exception& e) {
    throw Error::io(std::string("unreadable ffprobe output: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw Error::io(std::string("bad duration in ffprobe output: ") + e.what());
  }
  return out;
}

bool FfmpegVideoProbe::makeThumbnail(const std::string& filePath, const std::string& thumbnailPath,
                                     const char* seekTo) const {
  const std::string cmd = ffmpeg_ + " -v error -y -ss " + seekTo + " -i " + shellQuote(filePath) +
                          " -frames:v 1 -vf scale=" + scale_ + " " + shellQuote(thumbnailPath) +
                          " </dev/null >/dev/null 2>&1";
  int status = std::system(cmd.c_str());
  std::error_code ec;
  return status == 0 && std::filesystem::file_size(thumbnailPath, ec) > 0 && !ec;
}

VideoMetadata FfmpegVideoProbe::probe(const std::string& filePath, const std::string& thumbnailPath) {
  const std::string cmd = ffprobe_ +
    " -v error -select_streams v:0 -show_entries stream=width,height:format=duration -of json " +
    shellQuote(filePath) + " 2>/dev/null";
  VideoMetadata out = parseProbeOutput(run_capture(cmd));

  // clips shorter than a second have no frame at 00:00:01
  if (makeThumbnail(filePath, thumbnailPath, "1") || makeThumbnail(filePath, thumbnailPath, "0")) {
    out.thumbnail_path = thumbnailPath;
  } else {
    spdlog::warn("no thumbnail for {}", filePath);
  }
  return out;
}

} // namespace ifs
