#include "factory.hpp"

#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include "internal/config/market_tables_from_config.hpp"
#include "internal/core/market_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/host/standalone_host.hpp"
#include "internal/market/market_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/persistence/snapshot_store.hpp"
#include "internal/service/market_service.hpp"
#include "internal/service/service_context.hpp"

namespace usedgear::factory {

using observability::IntField;
using observability::StringField;

namespace {

void BootstrapSqliteSchema(db::sqlite::SqliteDB& sqlite_db) {
  sqlite_db.ApplySchema(db::sql::MarketRecordSchema());

  const int version = sqlite_db.SchemaVersion();
  if (version != db::sql::kMarketSchemaVersion) {
    throw std::runtime_error("market store " + sqlite_db.Path() + " has schema version " + std::to_string(version) +
                             ", expected " + std::to_string(db::sql::kMarketSchemaVersion));
  }
}

std::shared_ptr<db::Repository> BuildRepository(const usedgear::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(*sqlite_db);
    USEDGEAR_LOG_INFO("Using sqlite store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

model::Weather ParseWeather(const std::string& value) {
  if (value.empty()) return model::Weather::kSun;
  auto weather = model::WeatherFromString(value);
  if (!weather) {
    throw std::invalid_argument("unknown host.weather '" + value + "'");
  }
  return *weather;
}

std::uint64_t ResolveSeed(std::uint64_t configured) {
  if (configured != 0) return configured;
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const usedgear::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Host adapters
  // ------------------------------------------------------------------
  const auto& host_config = config.host();
  app.ledger        = std::make_shared<host::InMemoryLedger>(host_config.starting_balance());
  app.weather       = std::make_shared<host::FixedWeather>(ParseWeather(host_config.weather()));
  app.notifications = std::make_shared<host::QueueNotificationSink>();
  app.credit = std::make_shared<host::FixedCreditScore>(host_config.credit_score() != 0 ? host_config.credit_score() : 650);

  host::HostPorts ports;
  ports.ledger        = app.ledger;
  ports.weather       = app.weather;
  ports.notifications = app.notifications;
  ports.credit        = app.credit;

  // ------------------------------------------------------------------
  // Market
  // ------------------------------------------------------------------
  const auto seed = ResolveSeed(config.market().random_seed());
  app.market      = std::make_shared<market::MarketContext>(usedgear::config::MarketTablesFromConfig(config.market()), ports, seed);
  app.engine      = std::make_shared<core::MarketEngine>();

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.snapshots  = std::make_shared<persistence::SnapshotStore>(app.repository);

  persistence::LoadReport report;
  if (app.snapshots->Load(*app.market, &report)) {
    USEDGEAR_LOG_INFO("Restored market snapshot", {IntField("records", static_cast<std::int64_t>(report.loaded)),
                                                   IntField("skipped", static_cast<std::int64_t>(report.skipped))});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine        = app.engine;
  ctx.market        = app.market;
  ctx.snapshots     = app.snapshots;
  ctx.notifications = app.notifications;

  app.service = std::make_shared<service::MarketService>(ctx);

  USEDGEAR_LOG_INFO("Market ready", {IntField("seed", static_cast<std::int64_t>(seed))});
  return app;
}

} // namespace usedgear::factory
