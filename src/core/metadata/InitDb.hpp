#pragma once
#include <string>

namespace ifs {

// Creates the database file if needed, sets pragmas and applies schema.sql.
// Idempotent; safe to call on every start.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace ifs
