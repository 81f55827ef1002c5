#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace sensorweave::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Bridges
// ------------------------------------------------------------------

Result MemoryRepository::InsertBridge(Transaction& t, const model::BridgeRecord& r) {
  return TX(t).Apply([r](State& s) {
    if (s.bridges.contains(r.bridge_id)) return Result::Err(ErrorCode::AlreadyExists, "bridge " + r.bridge_id + " exists");
    s.bridges[r.bridge_id] = r;
    return Result::Ok();
  });
}

std::optional<model::BridgeRecord> MemoryRepository::GetBridge(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bridges.find(id);
  if (it == s.bridges.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BridgeRecord> MemoryRepository::ListBridges(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::BridgeRecord> records;
  records.reserve(s.bridges.size());
  for (const auto& [_, record] : s.bridges) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.bridge_id < b.bridge_id; });
  return records;
}

Result MemoryRepository::DeleteBridge(Transaction& t, const std::string& id) {
  return TX(t).Apply([id](State& s) {
    if (s.bridges.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "bridge " + id + " not found");
    s.events.erase(id);
    s.next_event_seq.erase(id);
    s.streams.erase(id);
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result MemoryRepository::AppendBridgeEvent(Transaction& t, model::BridgeEventRecord& r) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (!s.bridges.contains(r.bridge_id)) return Result::Err(ErrorCode::NotFound, "bridge " + r.bridge_id + " not found");

  // seq as seen by this snapshot; replay at commit may assign a later one
  auto it = s.next_event_seq.find(r.bridge_id);
  r.seq   = (it == s.next_event_seq.end() ? 0 : it->second) + 1;

  return tx.Apply([record = r](State& state) mutable {
    if (!state.bridges.contains(record.bridge_id)) {
      return Result::Err(ErrorCode::NotFound, "bridge " + record.bridge_id + " not found");
    }
    record.seq = ++state.next_event_seq[record.bridge_id];
    state.events[record.bridge_id].push_back(record);
    return Result::Ok();
  });
}

std::vector<model::BridgeEventRecord> MemoryRepository::ListBridgeEvents(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(id);
  if (it == s.events.end()) return {};
  return it->second;
}

Result MemoryRepository::TrimBridgeEvents(Transaction& t, const std::string& id, model::BridgeEventKind kind, uint64_t keep_latest) {
  return TX(t).Apply([id, kind, keep_latest](State& s) {
    auto it = s.events.find(id);
    if (it == s.events.end()) return Result::Ok();

    auto&    events = it->second;
    uint64_t seen   = 0;
    // walk newest first, drop everything of this kind past keep_latest
    for (auto rit = events.rbegin(); rit != events.rend();) {
      if (rit->kind == kind && ++seen > keep_latest) {
        rit = std::make_reverse_iterator(events.erase(std::next(rit).base()));
      } else {
        ++rit;
      }
    }
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Advertised streams
// ------------------------------------------------------------------

Result MemoryRepository::InsertStream(Transaction& t, const model::StreamRecord& r) {
  return TX(t).Apply([r](State& s) {
    if (!s.bridges.contains(r.bridge_id)) return Result::Err(ErrorCode::NotFound, "bridge " + r.bridge_id + " not found");
    auto& streams = s.streams[r.bridge_id];
    for (const auto& existing : streams) {
      if (existing.stream_id == r.stream_id) return Result::Err(ErrorCode::AlreadyExists, "stream " + r.stream_id + " exists");
    }
    streams.push_back(r);
    return Result::Ok();
  });
}

std::vector<model::StreamRecord> MemoryRepository::ListStreams(Transaction& t, const std::string& bridge_id) {
  const auto& s  = TX(t).View();
  auto        it = s.streams.find(bridge_id);
  if (it == s.streams.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Patterns
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPattern(Transaction& t, const model::PatternRecord& r) {
  return TX(t).Apply([r](State& s) {
    s.patterns[r.id] = r;
    return Result::Ok();
  });
}

std::optional<model::PatternRecord> MemoryRepository::GetPattern(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.patterns.find(id);
  if (it == s.patterns.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PatternRecord> MemoryRepository::ListPatterns(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::PatternRecord> records;
  records.reserve(s.patterns.size());
  for (const auto& [_, record] : s.patterns) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return records;
}

} // namespace sensorweave::db::memory
