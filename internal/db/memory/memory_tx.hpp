#pragma once

#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace sensorweave::db::memory {

/*
  Transaction = snapshot + redo log

  Reads see the snapshot plus this transaction's own writes. Commit
  replays the redo log against the latest committed state, so concurrent
  appends to different bridges or to the same event log both land.
  A replayed write that no longer applies (e.g. duplicate insert) aborts
  the whole commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  Result Apply(MemoryRepository::Mutation mutation);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                     repo_;
  MemoryRepository::State               working_;
  std::vector<MemoryRepository::Mutation> redo_;
  bool                                  committed_   = false;
  bool                                  rolled_back_ = false;
};

} // namespace sensorweave::db::memory
