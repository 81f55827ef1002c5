#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sensorweave::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertBridge(Transaction&, const model::BridgeRecord&) override;
  std::optional<model::BridgeRecord> GetBridge(Transaction&, const std::string&) override;
  std::vector<model::BridgeRecord>   ListBridges(Transaction&) override;
  Result                             DeleteBridge(Transaction&, const std::string&) override;

  Result                                AppendBridgeEvent(Transaction&, model::BridgeEventRecord&) override;
  std::vector<model::BridgeEventRecord> ListBridgeEvents(Transaction&, const std::string&) override;
  Result                                TrimBridgeEvents(Transaction&, const std::string&, model::BridgeEventKind, uint64_t) override;

  Result                           InsertStream(Transaction&, const model::StreamRecord&) override;
  std::vector<model::StreamRecord> ListStreams(Transaction&, const std::string&) override;

  Result                              UpsertPattern(Transaction&, const model::PatternRecord&) override;
  std::optional<model::PatternRecord> GetPattern(Transaction&, const std::string&) override;
  std::vector<model::PatternRecord>   ListPatterns(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace sensorweave::db::sqlite
