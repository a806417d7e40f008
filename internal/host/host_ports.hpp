#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/model/negotiation.hpp"

namespace usedgear::host {

/*
  Interfaces the surrounding application provides to the engine.
*/

enum class Severity : std::uint8_t {
  kInfo     = 1,
  kOk       = 2,
  kWarning  = 3,
  kCritical = 4,
};

constexpr std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kInfo:
      return "info";
    case Severity::kOk:
      return "ok";
    case Severity::kWarning:
      return "warning";
    case Severity::kCritical:
      return "critical";
  }
  return "unknown";
}

class Ledger {
 public:
  virtual ~Ledger() = default;

  // Both return false when the ledger refuses the movement (insufficient
  // funds, frozen account); no money moves in that case.
  virtual bool Debit(const std::string& owner_id, double amount)  = 0;
  virtual bool Credit(const std::string& owner_id, double amount) = 0;
};

class WeatherSource {
 public:
  virtual ~WeatherSource() = default;

  virtual model::Weather Current() const = 0;
};

class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual void Notify(const std::string& owner_id, const std::string& message, Severity severity) = 0;
};

class CreditScoreSource {
 public:
  virtual ~CreditScoreSource() = default;

  virtual std::uint32_t Score(const std::string& owner_id) const = 0;
};

/*
  Host collaborators handed to the engine. ledger, weather and
  notifications are required; credit may be null (no fee adjustment).
*/
struct HostPorts {
  std::shared_ptr<Ledger>            ledger;
  std::shared_ptr<WeatherSource>     weather;
  std::shared_ptr<NotificationSink>  notifications;
  std::shared_ptr<CreditScoreSource> credit;
};

} // namespace usedgear::host
