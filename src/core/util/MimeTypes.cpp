#include "MimeTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace ifs {

std::string extensionOf(const std::string& name) {
  auto slash = name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
  auto dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return {};
  std::string ext = base.substr(dot + 1);
  if (ext.size() > 10) return {};
  for (char c : ext) {
    if (!std::isalnum(static_cast<unsigned char>(c))) return {};
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::string mimeTypeForExtension(const std::string& ext) {
  static const std::unordered_map<std::string, std::string> types = {
    {"html","text/html"}, {"htm","text/html"}, {"css","text/css"},
    {"js","application/javascript"}, {"json","application/json"},
    {"xml","application/xml"}, {"txt","text/plain"}, {"csv","text/csv"},
    {"md","text/markdown"}, {"log","text/plain"},
    {"png","image/png"}, {"jpg","image/jpeg"}, {"jpeg","image/jpeg"},
    {"gif","image/gif"}, {"svg","image/svg+xml"}, {"webp","image/webp"},
    {"bmp","image/bmp"}, {"ico","image/x-icon"},
    {"mp3","audio/mpeg"}, {"wav","audio/wav"}, {"ogg","audio/ogg"},
    {"flac","audio/flac"}, {"m4a","audio/mp4"},
    {"mp4","video/mp4"}, {"m4v","video/mp4"}, {"webm","video/webm"},
    {"avi","video/x-msvideo"}, {"mkv","video/x-matroska"},
    {"mov","video/quicktime"}, {"wmv","video/x-ms-wmv"}, {"flv","video/x-flv"},
    {"pdf","application/pdf"}, {"zip","application/zip"},
    {"gz","application/gzip"}, {"tar","application/x-tar"},
    {"7z","application/x-7z-compressed"}, {"iso","application/x-iso9660-image"},
    {"doc","application/msword"}, {"xls","application/vnd.ms-excel"},
    {"docx","application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xlsx","application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
  };
  auto it = types.find(ext);
  return it != types.end() ? it->second : "application/octet-stream";
}

std::string contentDisposition(const std::string& name, bool inline_disposition) {
  static const char* kHex = "0123456789ABCDEF";
  std::string fallback;
  std::string encoded;
  for (unsigned char c : name) {
    const bool printable = c >= 0x20 && c < 0x7f;
    fallback += (!printable || c == '"' || c == '\\') ? '_' : static_cast<char>(c);

    // RFC 5987 attr-char
    if (std::isalnum(c) || (c != 0 && std::strchr("!#$&+-.^_`|~", c))) {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += kHex[c >> 4];
      encoded += kHex[c & 0x0f];
    }
  }
  return std::string(inline_disposition ? "inline" : "attachment") + "; filename=\"" + fallback +
         "\"; filename*=UTF-8''" + encoded;
}

} // namespace ifs
