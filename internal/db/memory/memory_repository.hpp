#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace sensorweave::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBridge(Transaction&, const model::BridgeRecord&) override;
  std::optional<model::BridgeRecord> GetBridge(Transaction&, const std::string&) override;
  std::vector<model::BridgeRecord> ListBridges(Transaction&) override;
  Result DeleteBridge(Transaction&, const std::string&) override;

  Result AppendBridgeEvent(Transaction&, model::BridgeEventRecord&) override;
  std::vector<model::BridgeEventRecord> ListBridgeEvents(Transaction&, const std::string&) override;
  Result TrimBridgeEvents(Transaction&, const std::string&, model::BridgeEventKind, uint64_t) override;

  Result InsertStream(Transaction&, const model::StreamRecord&) override;
  std::vector<model::StreamRecord> ListStreams(Transaction&, const std::string&) override;

  Result UpsertPattern(Transaction&, const model::PatternRecord&) override;
  std::optional<model::PatternRecord> GetPattern(Transaction&, const std::string&) override;
  std::vector<model::PatternRecord> ListPatterns(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::BridgeRecord> bridges;
    std::unordered_map<std::string, std::vector<model::BridgeEventRecord>> events;
    std::unordered_map<std::string, uint64_t> next_event_seq;
    std::unordered_map<std::string, std::vector<model::StreamRecord>> streams;
    std::unordered_map<std::string, model::PatternRecord> patterns;
  };

  // write applied to the snapshot, then replayed against committed state
  using Mutation = std::function<Result(State&)>;

  std::mutex mutex_;
  State committed_;
};

} // namespace sensorweave::db::memory
