#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/host/host_ports.hpp"

namespace usedgear::host {

/*
  Self-contained host adapters for running the engine outside a game:
  the server, the simulator and tests.
*/

class InMemoryLedger final : public Ledger {
 public:
  explicit InMemoryLedger(double starting_balance = 0.0);

  bool Debit(const std::string& owner_id, double amount) override;
  bool Credit(const std::string& owner_id, double amount) override;

  double Balance(const std::string& owner_id) const;
  void   SetBalance(const std::string& owner_id, double balance);

  // Makes every subsequent Debit/Credit fail.
  void Freeze(bool frozen);

 private:
  double BalanceLocked(const std::string& owner_id) const;

  double                                  starting_balance_;
  bool                                    frozen_ = false;
  mutable std::mutex                      mutex_;
  std::unordered_map<std::string, double> balances_;
};

class FixedWeather final : public WeatherSource {
 public:
  explicit FixedWeather(model::Weather weather = model::Weather::kSun);

  model::Weather Current() const override;
  void           Set(model::Weather weather);

 private:
  std::atomic<model::Weather> weather_;
};

struct Notification {
  std::string owner_id;
  std::string message;
  Severity    severity = Severity::kInfo;
};

/*
  Logs every notification and keeps it until drained.
*/
class QueueNotificationSink final : public NotificationSink {
 public:
  void Notify(const std::string& owner_id, const std::string& message, Severity severity) override;

  std::vector<Notification> Drain();
  std::size_t               Pending() const;

 private:
  mutable std::mutex        mutex_;
  std::vector<Notification> queue_;
};

class FixedCreditScore final : public CreditScoreSource {
 public:
  explicit FixedCreditScore(std::uint32_t default_score = 650);

  std::uint32_t Score(const std::string& owner_id) const override;
  void          Set(const std::string& owner_id, std::uint32_t score);

 private:
  std::uint32_t                                  default_score_;
  mutable std::mutex                             mutex_;
  std::unordered_map<std::string, std::uint32_t> scores_;
};

} // namespace usedgear::host
