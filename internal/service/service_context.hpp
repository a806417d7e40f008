#pragma once

#include <memory>

namespace usedgear::core { class MarketEngine; }
namespace usedgear::market { struct MarketContext; }
namespace usedgear::persistence { class SnapshotStore; }
namespace usedgear::host { class QueueNotificationSink; }

namespace usedgear::service {

struct ServiceContext {
  std::shared_ptr<usedgear::core::MarketEngine> engine;

  // Listings, searches, sales and inspections of the one running market.
  std::shared_ptr<usedgear::market::MarketContext> market;

  // Null when the market runs without a backing store; snapshot calls then fail.
  std::shared_ptr<usedgear::persistence::SnapshotStore> snapshots;

  // Messages for owners, drained by DrainNotifications.
  std::shared_ptr<usedgear::host::QueueNotificationSink> notifications;
};

}
