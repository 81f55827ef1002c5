#include "memory_tx.hpp"

#include <stdexcept>

namespace sensorweave::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

Result MemoryTransaction::Apply(MemoryRepository::Mutation mutation) {
  if (committed_ || rolled_back_) {
    return Result::Err(ErrorCode::Conflict, "transaction already finished");
  }
  auto result = mutation(working_);
  if (result) {
    redo_.push_back(std::move(mutation));
  }
  return result;
}

void MemoryTransaction::Commit() {
  if (committed_) {
    return;
  }
  if (rolled_back_) {
    throw std::runtime_error("commit after rollback");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (redo_.empty()) {
    committed_ = true;
    return;
  }

  auto next = repo_.committed_;
  for (const auto& mutation : redo_) {
    auto result = mutation(next);
    if (!result) {
      throw std::runtime_error("transaction conflict: " + result.message);
    }
  }
  repo_.committed_ = std::move(next);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  redo_.clear();
  rolled_back_ = true;
}

} // namespace sensorweave::db::memory
