#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace sensorweave::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS bridges (bridge_id TEXT PRIMARY KEY, owner TEXT NOT NULL, capability BLOB NOT NULL, registered_at_ms INTEGER NOT NULL, next_event_seq INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS bridge_events (bridge_id TEXT NOT NULL, seq INTEGER NOT NULL, kind INTEGER NOT NULL, actor TEXT NOT NULL, value INTEGER NOT NULL, "
      "at_ms INTEGER NOT NULL, PRIMARY KEY (bridge_id, seq), FOREIGN KEY(bridge_id) REFERENCES bridges(bridge_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS bridge_streams (bridge_id TEXT NOT NULL, stream_id TEXT NOT NULL, descriptor BLOB NOT NULL, created_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (bridge_id, stream_id), FOREIGN KEY(bridge_id) REFERENCES bridges(bridge_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS patterns (id TEXT PRIMARY KEY, body BLOB NOT NULL, updated_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT bridge_id,owner,capability,registered_at_ms FROM bridges LIMIT 1;");
  db.Exec("SELECT bridge_id,seq,kind,actor,value,at_ms FROM bridge_events LIMIT 1;");
  db.Exec("SELECT bridge_id,stream_id,descriptor,created_at_ms FROM bridge_streams LIMIT 1;");
  db.Exec("SELECT id,body,updated_at_ms FROM patterns LIMIT 1;");
}

} // namespace sensorweave::db::sqlite
