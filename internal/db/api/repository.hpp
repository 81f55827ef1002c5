#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/bridge_event_record.hpp"
#include "internal/db/model/bridge_record.hpp"
#include "internal/db/model/pattern_record.hpp"
#include "internal/db/model/stream_record.hpp"

namespace sensorweave::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Bridge events are append-only; seq is strictly increasing per bridge
  - Concurrent appends to the event log never conflict with each other

  The DB is the source of truth for:
    bridge registrations
    heartbeat / rating event log
    advertised streams
    pattern library state

  Registry and pattern views in memory are materialized from it.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Bridges
  // ---------------------------------------------------------------------

  virtual Result InsertBridge(Transaction&, const model::BridgeRecord&) = 0;

  virtual std::optional<model::BridgeRecord> GetBridge(Transaction&, const std::string& bridge_id) = 0;

  virtual std::vector<model::BridgeRecord> ListBridges(Transaction&) = 0;

  // removes the bridge together with its events and streams
  virtual Result DeleteBridge(Transaction&, const std::string& bridge_id) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // assigns record.seq
  virtual Result AppendBridgeEvent(Transaction&, model::BridgeEventRecord& record) = 0;

  // ordered by seq
  virtual std::vector<model::BridgeEventRecord> ListBridgeEvents(Transaction&, const std::string& bridge_id) = 0;

  // keeps the newest keep_latest events of the given kind
  virtual Result TrimBridgeEvents(Transaction&, const std::string& bridge_id, model::BridgeEventKind kind, uint64_t keep_latest) = 0;

  // ---------------------------------------------------------------------
  // Advertised streams
  // ---------------------------------------------------------------------

  virtual Result InsertStream(Transaction&, const model::StreamRecord&) = 0;

  virtual std::vector<model::StreamRecord> ListStreams(Transaction&, const std::string& bridge_id) = 0;

  // ---------------------------------------------------------------------
  // Patterns
  // ---------------------------------------------------------------------

  virtual Result UpsertPattern(Transaction&, const model::PatternRecord&) = 0;

  virtual std::optional<model::PatternRecord> GetPattern(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::PatternRecord> ListPatterns(Transaction&) = 0;
};

} // namespace sensorweave::db
