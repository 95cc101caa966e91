#pragma once
#ifndef MERKLECLAIM_CLAIM_STORE_H
#define MERKLECLAIM_CLAIM_STORE_H

#include "utilities/digest.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace merkleclaim {

/// Separator between fields in the redemption record file.
const char RECORD_SEPARATOR = '|';

enum class RedemptionState {
  Pending, ///< Journaled before the transfer; resolved by completion or reconcile
  Claimed  ///< Terminal
};

/**
 * @brief Durable state of the claim engine: the active root and the
 * redemption record.
 *
 * With file paths configured, every mutation is written before the call
 * returns. Files are replaced through a temporary and a rename so a crash
 * leaves either the previous or the new contents.
 *
 * Layout:
 *   root file:         one line, 64 hex characters
 *   redemptions file:  `address|C` or `address|P` per line
 *
 * A default-constructed store keeps everything in memory.
 */
class ClaimStore {
public:
  ClaimStore() = default;
  ClaimStore(std::string rootPath, std::string redemptionsPath);

  ClaimStore(const ClaimStore &) = delete;
  ClaimStore &operator=(const ClaimStore &) = delete;

  /**
   * @brief Replace in-memory state with the persisted files.
   *
   * Missing files are treated as empty state.
   * @throw std::runtime_error On a malformed line or digest.
   */
  void load();

  bool persistent() const { return !rootPath_.empty(); }

  Digest root() const;

  /**
   * @brief Replace the root.
   * @throw std::runtime_error If the root file cannot be written; the
   *        in-memory root is left unchanged.
   */
  void setRoot(const Digest &root);

  std::optional<RedemptionState> state(const Address &recipient) const;

  /**
   * @brief Journal a redemption in progress.
   * @return false if the recipient already has a record.
   * @throw std::runtime_error If the record cannot be written; nothing is
   *        recorded in that case.
   */
  bool markPending(const Address &recipient);

  /**
   * @brief Mark a recipient claimed.
   *
   * The in-memory record is updated even if writing fails; the previous
   * on-disk entry (normally Pending) then stays until the next write.
   * @throw std::runtime_error If the record cannot be written.
   */
  void markClaimed(const Address &recipient);

  /**
   * @brief Drop a record (rollback of a pending redemption).
   * @throw std::runtime_error If the record cannot be written.
   */
  void erase(const Address &recipient);

  size_t claimedCount() const;
  std::vector<Address> pending() const;

private:
  void saveRootLocked() const;
  void saveRecordsLocked() const;

  mutable std::mutex mutex_;
  std::string rootPath_;
  std::string redemptionsPath_;
  Digest root_{};
  std::unordered_map<Address, RedemptionState, AddressHash> records_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_CLAIM_STORE_H
