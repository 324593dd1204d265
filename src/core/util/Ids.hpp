#pragma once
#include <cstdint>
#include <string>

namespace ifs {

// Random RFC 4122 version-4 identifier, lower-case hex with dashes.
std::string uuid4();

// Milliseconds since the Unix epoch.
int64_t nowMillis();

// "2024-05-01T12:30:00.250Z"
std::string formatIsoMillis(int64_t epochMillis);

} // namespace ifs
