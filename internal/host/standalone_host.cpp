#include "standalone_host.hpp"

#include "internal/observability/logging.hpp"

namespace usedgear::host {

using usedgear::observability::DoubleField;
using usedgear::observability::StringField;

InMemoryLedger::InMemoryLedger(double starting_balance) : starting_balance_(starting_balance) {
}

double InMemoryLedger::BalanceLocked(const std::string& owner_id) const {
  auto it = balances_.find(owner_id);
  return it == balances_.end() ? starting_balance_ : it->second;
}

bool InMemoryLedger::Debit(const std::string& owner_id, double amount) {
  std::lock_guard lock(mutex_);
  if (frozen_ || amount < 0.0) return false;

  const auto balance = BalanceLocked(owner_id);
  if (balance < amount) {
    USEDGEAR_LOG_DEBUG("ledger debit refused", {StringField("owner", owner_id), DoubleField("amount", amount), DoubleField("balance", balance)});
    return false;
  }
  balances_[owner_id] = balance - amount;
  return true;
}

bool InMemoryLedger::Credit(const std::string& owner_id, double amount) {
  std::lock_guard lock(mutex_);
  if (frozen_ || amount < 0.0) return false;
  balances_[owner_id] = BalanceLocked(owner_id) + amount;
  return true;
}

double InMemoryLedger::Balance(const std::string& owner_id) const {
  std::lock_guard lock(mutex_);
  return BalanceLocked(owner_id);
}

void InMemoryLedger::SetBalance(const std::string& owner_id, double balance) {
  std::lock_guard lock(mutex_);
  balances_[owner_id] = balance;
}

void InMemoryLedger::Freeze(bool frozen) {
  std::lock_guard lock(mutex_);
  frozen_ = frozen;
}

FixedWeather::FixedWeather(model::Weather weather) : weather_(weather) {
}

model::Weather FixedWeather::Current() const {
  return weather_.load();
}

void FixedWeather::Set(model::Weather weather) {
  weather_.store(weather);
}

void QueueNotificationSink::Notify(const std::string& owner_id, const std::string& message, Severity severity) {
  USEDGEAR_LOG_INFO("notify", {StringField("owner", owner_id), StringField("severity", ToString(severity)), StringField("message", message)});

  std::lock_guard lock(mutex_);
  queue_.push_back({owner_id, message, severity});
}

std::vector<Notification> QueueNotificationSink::Drain() {
  std::lock_guard           lock(mutex_);
  std::vector<Notification> drained;
  drained.swap(queue_);
  return drained;
}

std::size_t QueueNotificationSink::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

FixedCreditScore::FixedCreditScore(std::uint32_t default_score) : default_score_(default_score) {
}

std::uint32_t FixedCreditScore::Score(const std::string& owner_id) const {
  std::lock_guard lock(mutex_);
  auto            it = scores_.find(owner_id);
  return it == scores_.end() ? default_score_ : it->second;
}

void FixedCreditScore::Set(const std::string& owner_id, std::uint32_t score) {
  std::lock_guard lock(mutex_);
  scores_[owner_id] = score;
}

} // namespace usedgear::host
