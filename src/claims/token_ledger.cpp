#include "claims/token_ledger.h"

#include <limits>

namespace merkleclaim {

namespace {

bool addWouldOverflow(Amount a, Amount b) {
  return a > std::numeric_limits<Amount>::max() - b;
}

} // namespace

InMemoryTokenLedger::InMemoryTokenLedger(std::string symbol, Amount pool)
    : symbol_(std::move(symbol)), pool_(pool) {}

bool InMemoryTokenLedger::transfer(const Address &to, Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failTransfers_ || amount > pool_)
    return false;
  Amount &balance = balances_[to];
  if (addWouldOverflow(balance, amount))
    return false;
  pool_ -= amount;
  balance += amount;
  ++transfers_;
  return true;
}

Amount InMemoryTokenLedger::balanceOf(const Address &account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

bool InMemoryTokenLedger::fund(Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (addWouldOverflow(pool_, amount))
    return false;
  pool_ += amount;
  return true;
}

bool InMemoryTokenLedger::mint(const Address &to, Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  Amount &balance = balances_[to];
  if (addWouldOverflow(balance, amount))
    return false;
  balance += amount;
  return true;
}

Amount InMemoryTokenLedger::poolBalance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_;
}

size_t InMemoryTokenLedger::transferCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_;
}

void InMemoryTokenLedger::setFailTransfers(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  failTransfers_ = fail;
}

} // namespace merkleclaim
