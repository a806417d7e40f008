#pragma once

#include <memory>

#include "config/config.pb.h"

namespace usedgear::db { class Repository; }
namespace usedgear::host {
class InMemoryLedger;
class FixedWeather;
class QueueNotificationSink;
class FixedCreditScore;
}
namespace usedgear::market { struct MarketContext; }
namespace usedgear::core { class MarketEngine; }
namespace usedgear::persistence { class SnapshotStore; }
namespace usedgear::service { class MarketService; }

namespace usedgear::factory {

/*
  Application

  Owns all long-lived objects used by the server and the simulator.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<host::InMemoryLedger>        ledger;
  std::shared_ptr<host::FixedWeather>          weather;
  std::shared_ptr<host::QueueNotificationSink> notifications;
  std::shared_ptr<host::FixedCreditScore>      credit;

  std::shared_ptr<market::MarketContext>      market;
  std::shared_ptr<core::MarketEngine>         engine;
  std::shared_ptr<persistence::SnapshotStore> snapshots;
  std::shared_ptr<service::MarketService>     service;
};

/*
  Build

  Constructs the whole backend from runtime config and restores the last
  saved snapshot when the store has one.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and host types.
*/
Application Build(const usedgear::runtime::config::RuntimeConfig& config);

} // namespace usedgear::factory
