#pragma once
#include <string>

namespace ifs {

// Lower-cased extension without the dot, or "" when the name has none that
// looks like a real extension ("archive.tar.gz" -> "gz", ".bashrc" -> "").
std::string extensionOf(const std::string& name);

// MIME type for an extension as returned by extensionOf().
std::string mimeTypeForExtension(const std::string& ext);

// Content-Disposition value for a client-supplied file name: an ASCII
// fallback with quotes, backslashes and non-ASCII bytes replaced by '_',
// plus the exact name as an RFC 5987 filename*.
std::string contentDisposition(const std::string& name, bool inline_disposition);

} // namespace ifs
