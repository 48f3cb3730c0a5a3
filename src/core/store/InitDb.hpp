#pragma once
#include <string>

namespace mba {

constexpr int kSchemaVersion = 1;

// Creates the database if needed and applies the schema file. Throws on failure.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

// Same as initDatabase() with the schema passed in directly.
bool initDatabaseFromSql(const std::string& dbPath, const std::string& schemaSql);

} // namespace mba
