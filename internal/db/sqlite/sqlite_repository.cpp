#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>

namespace sensorweave::db::sqlite {

using sensorweave::db::ErrorCode;
using sensorweave::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    st = nullptr;
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  int         size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::BridgeRecord ReadBridge(sqlite3_stmt* st) {
  model::BridgeRecord r;
  r.bridge_id        = ColText(st, 0);
  r.owner            = ColText(st, 1);
  r.capability       = ColBlob(st, 2);
  r.registered_at_ms = ColU64(st, 3);
  return r;
}

model::PatternRecord ReadPattern(sqlite3_stmt* st) {
  model::PatternRecord r;
  r.id            = ColText(st, 0);
  r.body          = ColBlob(st, 1);
  r.updated_at_ms = ColU64(st, 2);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Bridges
// ------------------------------------------------------------------

Result SqliteRepository::InsertBridge(Transaction& t, const model::BridgeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO bridges(bridge_id,owner,capability,registered_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.bridge_id);
  BindText(st.get(), 2, r.owner);
  BindBlob(st.get(), 3, r.capability);
  BindU64(st.get(), 4, r.registered_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BridgeRecord> SqliteRepository::GetBridge(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT bridge_id,owner,capability,registered_at_ms FROM bridges WHERE bridge_id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadBridge(st.get());
}

std::vector<model::BridgeRecord> SqliteRepository::ListBridges(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT bridge_id,owner,capability,registered_at_ms FROM bridges ORDER BY bridge_id;");

  std::vector<model::BridgeRecord> out;
  if (!st) return out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadBridge(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteBridge(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  // events and streams go with it via ON DELETE CASCADE
  auto st = Prepare(db, "DELETE FROM bridges WHERE bridge_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "bridge " + id + " not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendBridgeEvent(Transaction& t, model::BridgeEventRecord& r) {
  auto* db = TX(t).Handle();

  // per-bridge counter, never reused after trimming
  auto bump = Prepare(db, "UPDATE bridges SET next_event_seq=next_event_seq+1 WHERE bridge_id=? RETURNING next_event_seq;");
  if (!bump) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(bump.get(), 1, r.bridge_id);

  int rc = sqlite3_step(bump.get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "bridge " + r.bridge_id + " not found");
  if (rc != SQLITE_ROW) return Translate(db, rc);
  uint64_t seq = ColU64(bump.get(), 0);
  bump.reset();

  auto st = Prepare(db, "INSERT INTO bridge_events(bridge_id,seq,kind,actor,value,at_ms) VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.bridge_id);
  BindU64(st.get(), 2, seq);
  BindI64(st.get(), 3, static_cast<int64_t>(r.kind));
  BindText(st.get(), 4, r.actor);
  BindI64(st.get(), 5, r.value);
  BindU64(st.get(), 6, r.at_ms);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  r.seq = seq;
  return Result::Ok();
}

std::vector<model::BridgeEventRecord> SqliteRepository::ListBridgeEvents(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT bridge_id,seq,kind,actor,value,at_ms FROM bridge_events WHERE bridge_id=? ORDER BY seq;");

  std::vector<model::BridgeEventRecord> out;
  if (!st) return out;
  BindText(st.get(), 1, id);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::BridgeEventRecord r;
    r.bridge_id = ColText(st.get(), 0);
    r.seq       = ColU64(st.get(), 1);
    r.kind      = static_cast<model::BridgeEventKind>(ColI64(st.get(), 2));
    r.actor     = ColText(st.get(), 3);
    r.value     = ColI64(st.get(), 4);
    r.at_ms     = ColU64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::TrimBridgeEvents(Transaction& t, const std::string& id, model::BridgeEventKind kind, uint64_t keep_latest) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "DELETE FROM bridge_events WHERE bridge_id=?1 AND kind=?2 AND seq NOT IN "
                     "(SELECT seq FROM bridge_events WHERE bridge_id=?1 AND kind=?2 ORDER BY seq DESC LIMIT ?3);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  BindI64(st.get(), 2, static_cast<int64_t>(kind));
  BindU64(st.get(), 3, keep_latest);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Advertised streams
// ------------------------------------------------------------------

Result SqliteRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  if (!GetBridge(t, r.bridge_id)) return Result::Err(ErrorCode::NotFound, "bridge " + r.bridge_id + " not found");

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO bridge_streams(bridge_id,stream_id,descriptor,created_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.bridge_id);
  BindText(st.get(), 2, r.stream_id);
  BindBlob(st.get(), 3, r.descriptor);
  BindU64(st.get(), 4, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::StreamRecord> SqliteRepository::ListStreams(Transaction& t, const std::string& bridge_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT stream_id,bridge_id,descriptor,created_at_ms FROM bridge_streams WHERE bridge_id=? ORDER BY rowid;");

  std::vector<model::StreamRecord> out;
  if (!st) return out;
  BindText(st.get(), 1, bridge_id);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::StreamRecord r;
    r.stream_id     = ColText(st.get(), 0);
    r.bridge_id     = ColText(st.get(), 1);
    r.descriptor    = ColBlob(st.get(), 2);
    r.created_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Patterns
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPattern(Transaction& t, const model::PatternRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO patterns(id,body,updated_at_ms) VALUES(?,?,?) "
                     "ON CONFLICT(id) DO UPDATE SET body=excluded.body, updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindBlob(st.get(), 2, r.body);
  BindU64(st.get(), 3, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PatternRecord> SqliteRepository::GetPattern(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,body,updated_at_ms FROM patterns WHERE id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPattern(st.get());
}

std::vector<model::PatternRecord> SqliteRepository::ListPatterns(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,body,updated_at_ms FROM patterns ORDER BY id;");

  std::vector<model::PatternRecord> out;
  if (!st) return out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadPattern(st.get()));
  }
  return out;
}

} // namespace sensorweave::db::sqlite
