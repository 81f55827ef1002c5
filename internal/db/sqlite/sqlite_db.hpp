#pragma once

#include <sqlite3.h>

#include <chrono>
#include <string>

namespace sensorweave::db::sqlite {

/*
  Owns the node's sqlite3 connection.

  The registry event log and the pattern library share one file. The
  connection is opened in serialized mode and every repository call runs
  inside a BEGIN IMMEDIATE transaction, so a single handle is enough.

  ":memory:" opens a private in-memory database.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // runs one or more statements, throws std::runtime_error with the sqlite message
  void Exec(const std::string& sql);

 private:
  void ApplyPragmas(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace sensorweave::db::sqlite
