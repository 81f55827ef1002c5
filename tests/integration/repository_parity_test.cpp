#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if SENSORWEAVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using sensorweave::db::ErrorCode;
using sensorweave::db::Repository;
using sensorweave::db::memory::MemoryRepository;
using sensorweave::db::model::BridgeEventKind;
using sensorweave::db::model::BridgeEventRecord;
using sensorweave::db::model::BridgeRecord;
using sensorweave::db::model::PatternRecord;
using sensorweave::db::model::StreamRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

BridgeRecord Bridge(const std::string& id) {
  // capability bytes are opaque to the repository; include a NUL to catch text truncation
  return BridgeRecord{.bridge_id = id, .owner = "owner-" + id, .capability = std::string("cap\0", 4) + id, .registered_at_ms = 1000};
}

BridgeEventRecord Event(const std::string& bridge_id, BridgeEventKind kind, const std::string& actor, int64_t value, uint64_t at_ms) {
  return BridgeEventRecord{.bridge_id = bridge_id, .kind = kind, .actor = actor, .value = value, .at_ms = at_ms};
}

void VerifyBridgeLifecycle(Repository& repo, const std::string& prefix) {
  const auto a = Bridge(prefix + "-a");
  const auto b = Bridge(prefix + "-b");

  {
    auto tx = repo.Begin();
    assert(repo.InsertBridge(*tx, b));
    assert(repo.InsertBridge(*tx, a));

    const auto duplicate = repo.InsertBridge(*tx, a);
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto fetched = repo.GetBridge(*tx, a.bridge_id);
    assert(fetched.has_value());
    assert(fetched->owner == a.owner);
    assert(fetched->capability == a.capability);
    assert(fetched->registered_at_ms == 1000);
    assert(!repo.GetBridge(*tx, prefix + "-missing").has_value());

    std::vector<std::string> ids;
    for (const auto& record : repo.ListBridges(*tx)) {
      if (record.bridge_id.rfind(prefix, 0) == 0) ids.push_back(record.bridge_id);
    }
    assert((ids == std::vector<std::string>{a.bridge_id, b.bridge_id}));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteBridge(*tx, b.bridge_id));
    const auto again = repo.DeleteBridge(*tx, b.bridge_id);
    assert(again.code == ErrorCode::NotFound);
    assert(!repo.GetBridge(*tx, b.bridge_id).has_value());
    tx->Commit();
  }
}

void VerifyEventLog(Repository& repo, const std::string& bridge_id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBridge(*tx, Bridge(bridge_id)));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    for (uint64_t i = 0; i < 4; ++i) {
      auto heartbeat = Event(bridge_id, BridgeEventKind::kHeartbeat, "owner", 0, 2000 + i);
      assert(repo.AppendBridgeEvent(*tx, heartbeat));
      assert(heartbeat.seq == 2 * i + 1);

      auto rating = Event(bridge_id, BridgeEventKind::kRating, "rater-" + std::to_string(i), 60 + static_cast<int64_t>(i), 2000 + i);
      assert(repo.AppendBridgeEvent(*tx, rating));
      assert(rating.seq == 2 * i + 2);
    }

    auto orphan = Event(bridge_id + "-missing", BridgeEventKind::kHeartbeat, "owner", 0, 1);
    assert(repo.AppendBridgeEvent(*tx, orphan).code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto       tx     = repo.Begin();
    const auto events = repo.ListBridgeEvents(*tx, bridge_id);
    assert(events.size() == 8);
    for (std::size_t i = 1; i < events.size(); ++i) assert(events[i - 1].seq < events[i].seq);
    assert(events[1].kind == BridgeEventKind::kRating);
    assert(events[1].actor == "rater-0");
    assert(events[1].value == 60);
    assert(events[6].at_ms == 2003);
    tx->Commit();
  }

  // trimming one kind leaves the other untouched and never reuses seq
  {
    auto tx = repo.Begin();
    assert(repo.TrimBridgeEvents(*tx, bridge_id, BridgeEventKind::kHeartbeat, 1));
    tx->Commit();
  }
  {
    auto       tx     = repo.Begin();
    const auto events = repo.ListBridgeEvents(*tx, bridge_id);
    assert(events.size() == 5);
    std::size_t heartbeats = 0;
    for (const auto& e : events) {
      if (e.kind == BridgeEventKind::kHeartbeat) {
        ++heartbeats;
        assert(e.seq == 7);
      }
    }
    assert(heartbeats == 1);

    auto next = Event(bridge_id, BridgeEventKind::kHeartbeat, "owner", 0, 3000);
    assert(repo.AppendBridgeEvent(*tx, next));
    assert(next.seq == 9);
    tx->Commit();
  }

  // deleting the bridge drops its log
  {
    auto tx = repo.Begin();
    assert(repo.DeleteBridge(*tx, bridge_id));
    assert(repo.ListBridgeEvents(*tx, bridge_id).empty());
    tx->Commit();
  }
}

void VerifyStreams(Repository& repo, const std::string& bridge_id) {
  auto tx = repo.Begin();
  assert(repo.InsertBridge(*tx, Bridge(bridge_id)));

  const StreamRecord ch0{.stream_id = bridge_id + "/ch0", .bridge_id = bridge_id, .descriptor = "descriptor-0", .created_at_ms = 10};
  const StreamRecord ch1{.stream_id = bridge_id + "/ch1", .bridge_id = bridge_id, .descriptor = "descriptor-1", .created_at_ms = 11};
  assert(repo.InsertStream(*tx, ch0));
  assert(repo.InsertStream(*tx, ch1));
  assert(repo.InsertStream(*tx, ch0).code == ErrorCode::AlreadyExists);

  StreamRecord orphan = ch0;
  orphan.bridge_id    = bridge_id + "-missing";
  assert(repo.InsertStream(*tx, orphan).code == ErrorCode::NotFound);

  const auto streams = repo.ListStreams(*tx, bridge_id);
  assert(streams.size() == 2);
  assert(streams[0].stream_id == ch0.stream_id);
  assert(streams[1].descriptor == "descriptor-1");
  assert(streams[1].created_at_ms == 11);

  assert(repo.DeleteBridge(*tx, bridge_id));
  assert(repo.ListStreams(*tx, bridge_id).empty());
  tx->Commit();
}

void VerifyPatterns(Repository& repo, const std::string& prefix) {
  const PatternRecord first{.id = prefix + "-1", .body = std::string("body\0v1", 7), .updated_at_ms = 5};
  const PatternRecord second{.id = prefix + "-2", .body = "other", .updated_at_ms = 6};

  {
    auto tx = repo.Begin();
    assert(repo.UpsertPattern(*tx, second));
    assert(repo.UpsertPattern(*tx, first));
    tx->Commit();
  }

  {
    auto          tx      = repo.Begin();
    PatternRecord updated = first;
    updated.body          = "body-v2";
    updated.updated_at_ms = 9;
    assert(repo.UpsertPattern(*tx, updated));

    const auto fetched = repo.GetPattern(*tx, first.id);
    assert(fetched.has_value());
    assert(fetched->body == "body-v2");
    assert(fetched->updated_at_ms == 9);
    assert(!repo.GetPattern(*tx, prefix + "-missing").has_value());

    std::vector<std::string> ids;
    for (const auto& record : repo.ListPatterns(*tx)) {
      if (record.id.rfind(prefix, 0) == 0) ids.push_back(record.id);
    }
    assert((ids == std::vector<std::string>{first.id, second.id}));
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBridge(*tx, Bridge(id)));
    assert(repo.UpsertPattern(*tx, PatternRecord{.id = id, .body = "x", .updated_at_ms = 1}));
    tx->Rollback();
  }
  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertBridge(*tx, Bridge(id + "-dropped")));
  }

  auto check = repo.Begin();
  assert(!repo.GetBridge(*check, id).has_value());
  assert(!repo.GetBridge(*check, id + "-dropped").has_value());
  assert(!repo.GetPattern(*check, id).has_value());
  check->Commit();
}

void VerifyConcurrentAppends(Repository& repo, const std::string& bridge_id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBridge(*tx, Bridge(bridge_id)));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto from_owner = Event(bridge_id, BridgeEventKind::kHeartbeat, "owner", 0, 1);
  auto from_rater = Event(bridge_id, BridgeEventKind::kRating, "rater", 80, 2);
  assert(repo.AppendBridgeEvent(*tx1, from_owner));
  assert(repo.AppendBridgeEvent(*tx2, from_rater));
  tx1->Commit();
  tx2->Commit();

  auto       verify = repo.Begin();
  const auto events = repo.ListBridgeEvents(*verify, bridge_id);
  assert(events.size() == 2);
  assert(events[0].seq == 1 && events[0].actor == "owner");
  assert(events[1].seq == 2 && events[1].actor == "rater");
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertBridge(*tx, Bridge(id)));
    auto heartbeat = Event(id, BridgeEventKind::kHeartbeat, "owner", 0, 42);
    assert(repo->AppendBridgeEvent(*tx, heartbeat));
    assert(repo->InsertStream(*tx, StreamRecord{.stream_id = id + "/ch0", .bridge_id = id, .descriptor = "d", .created_at_ms = 1}));
    assert(repo->UpsertPattern(*tx, PatternRecord{.id = id, .body = "merged", .updated_at_ms = 3}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetBridge(*tx, id).has_value());
  const auto events = repo->ListBridgeEvents(*tx, id);
  assert(events.size() == 1);
  assert(events[0].at_ms == 42);
  assert(repo->ListStreams(*tx, id).size() == 1);
  assert(repo->GetPattern(*tx, id)->body == "merged");

  // the seq counter survives the restart
  auto next = Event(id, BridgeEventKind::kHeartbeat, "owner", 0, 43);
  assert(repo->AppendBridgeEvent(*tx, next));
  assert(next.seq == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if SENSORWEAVE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path =
      (std::filesystem::temp_directory_path() / "sensorweave_repository_parity" / ("node_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<sensorweave::db::sqlite::SqliteDB>(db_path);
    sensorweave::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<sensorweave::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyBridgeLifecycle(*repo, backend.name + "-bridge");
    VerifyEventLog(*repo, backend.name + "-events");
    VerifyStreams(*repo, backend.name + "-streams");
    VerifyPatterns(*repo, backend.name + "-pattern");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyConcurrentAppends(*repo, backend.name + "-concurrent", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SENSORWEAVE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
