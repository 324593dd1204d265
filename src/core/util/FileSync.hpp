#pragma once
#include <string>

namespace ifs {

// fsync() a regular file so its contents survive a power loss.
// Throws IOFailure.
void syncFile(const std::string& path);

// fsync() a directory so renames and creations inside it are durable.
// Throws IOFailure.
void syncDirectory(const std::string& path);

} // namespace ifs
