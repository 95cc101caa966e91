#pragma once
#ifndef MERKLECLAIM_TOKEN_LEDGER_H
#define MERKLECLAIM_TOKEN_LEDGER_H

#include "utilities/digest.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace merkleclaim {

/**
 * @brief Fungible token ledger the claim engine pays out of.
 *
 * transfer() moves tokens held by the engine to @p to. Returning false or
 * throwing both count as a failed transfer.
 */
class TokenLedger {
public:
  virtual ~TokenLedger() = default;

  virtual bool transfer(const Address &to, Amount amount) = 0;
  virtual Amount balanceOf(const Address &account) const = 0;
  virtual std::string symbol() const = 0;
};

/**
 * @brief Process-local ledger backed by a pool owned by the engine.
 */
class InMemoryTokenLedger : public TokenLedger {
public:
  explicit InMemoryTokenLedger(std::string symbol, Amount pool = 0);

  bool transfer(const Address &to, Amount amount) override;
  Amount balanceOf(const Address &account) const override;
  std::string symbol() const override { return symbol_; }

  /** Add tokens to the engine's pool. Returns false on overflow. */
  bool fund(Amount amount);

  /** Credit an account directly. Returns false on overflow. */
  bool mint(const Address &to, Amount amount);

  Amount poolBalance() const;
  size_t transferCount() const;

  /** Make every subsequent transfer() return false. */
  void setFailTransfers(bool fail);

private:
  mutable std::mutex mutex_;
  std::string symbol_;
  Amount pool_;
  std::unordered_map<Address, Amount, AddressHash> balances_;
  size_t transfers_ = 0;
  bool failTransfers_ = false;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_TOKEN_LEDGER_H
