#pragma once

#include "sqlite_db.hpp"

namespace sensorweave::db::sqlite {

// Creates the registry and pattern tables if missing, then checks each
// column set so a stale database file fails at startup instead of on
// the first request.
void BootstrapSchema(SqliteDB& db);

} // namespace sensorweave::db::sqlite
