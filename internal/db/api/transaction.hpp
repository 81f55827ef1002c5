#pragma once

namespace sensorweave::db {

/*
  Unit of work over the registry and pattern tables.

  Writes become visible to other transactions only on Commit(). Reads
  through the same transaction see its own writes. Destroying an
  unfinished transaction rolls it back.

  sqlite: BEGIN IMMEDIATE on the shared connection, one open at a time.
  memory: private snapshot plus a redo log replayed under the repository
          lock at commit, so concurrent event appends never conflict.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace sensorweave::db
