#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/crypto/crypto.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/pattern_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/identity/identity_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pattern/known_patterns.hpp"
#include "internal/pattern/pattern_library.hpp"
#include "internal/registry/capability_registry.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/service/caller_auth.hpp"
#include "internal/service/pattern_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if SENSORWEAVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace sensorweave::factory {

using namespace sensorweave;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const sensorweave::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SENSORWEAVE_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<identity::IdentityDirectory> BuildIdentities(const sensorweave::runtime::config::RuntimeConfig& config) {
  auto identities = std::make_shared<identity::InMemoryIdentityDirectory>();
  for (const auto& entry : config.identities()) {
    if (entry.identity().empty()) {
      throw std::runtime_error("identities: entry without identity");
    }
    std::string key;
    try {
      key = crypto::FromHex(entry.public_key_hex());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("identities: bad public key for " + entry.identity() + ": " + e.what());
    }
    if (key.size() != 32) {
      throw std::runtime_error("identities: public key for " + entry.identity() + " must be 32 bytes");
    }
    identities->Put(entry.identity(), std::move(key));
  }
  return identities;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const sensorweave::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Replicas
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto identities = BuildIdentities(config);
  app.registry = std::make_shared<registry::CapabilityRegistry>(app.repository, identities,
                                                                 registry::RegistryOptions::FromConfig(config.registry()));
  app.registry->Hydrate();

  const auto pattern_options = pattern::PatternOptions::FromConfig(config.patterns());
  app.patterns               = std::make_shared<pattern::PatternLibrary>(app.repository, pattern_options);
  app.patterns->Hydrate();
  if (pattern_options.seed_known_patterns) {
    const auto added = pattern::SeedKnownPatterns(*app.patterns);
    SENSORWEAVE_LOG_INFO("Seeded known patterns", {observability::IntField("added", static_cast<int64_t>(added))});
  }

  SENSORWEAVE_LOG_INFO("Replicas hydrated", {observability::IntField("bridges", static_cast<int64_t>(app.registry->Size())),
                                             observability::IntField("patterns", static_cast<int64_t>(app.patterns->Size()))});

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  auto maintenance = std::make_shared<runtime::MaintenanceWorker>(
      util::DurationOr(config.registry().maintenance_interval(), std::chrono::seconds(10)));
  maintenance->AddTask("purge_challenges", [registry = app.registry] {
    const auto purged = registry->PurgeExpiredChallenges();
    if (purged > 0) {
      SENSORWEAVE_LOG_DEBUG("Purged expired challenges", {observability::IntField("count", static_cast<int64_t>(purged))});
    }
  });
  maintenance->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry   = app.registry;
  ctx.patterns   = app.patterns;
  ctx.repository = app.repository;
  ctx.callers    = std::make_shared<service::CallerAuthenticator>(
      identities, util::DurationOr(config.registry().caller_clock_skew(), std::chrono::seconds(30)));

  auto registry_service = std::make_shared<service::RegistryService>(ctx);
  auto pattern_service  = std::make_shared<service::PatternService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service));
  app.grpc_services.push_back(std::make_unique<grpc::PatternServer>(pattern_service));

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(maintenance);

  return app;
}

} // namespace sensorweave::factory
