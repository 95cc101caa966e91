#pragma once
#ifndef MERKLECLAIM_CLAIM_LEDGER_H
#define MERKLECLAIM_CLAIM_LEDGER_H

#include "claims/claim_errors.h"
#include "claims/claim_store.h"
#include "claims/pause_switch.h"
#include "claims/token_ledger.h"
#include "utilities/audit_log.hpp"
#include "utilities/merkle_tree.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace merkleclaim {

/** Payment handed to the token ledger for a successful claim. */
struct TransferInstruction {
  Address recipient{};
  Amount amount{0};
};

/**
 * @brief Either a TransferInstruction or the reason the claim was refused.
 */
struct ClaimResult {
  ErrorKind error{ErrorKind::None};
  TransferInstruction instruction{};

  bool ok() const { return error == ErrorKind::None; }
  explicit operator bool() const { return ok(); }
};

/**
 * @brief Redeems entitlements committed to by a Merkle root, each at most
 * once.
 *
 * claim(), rotateRoot() and reconcile() are serialized by one mutex, so a
 * claim sees a single root for its whole verification and two claims for
 * the same recipient cannot both pass the redemption check. The mutex is
 * recursive: a token ledger that calls back into claim() from transfer()
 * finds the recipient already journaled and gets AlreadyClaimed.
 *
 * A recipient is journaled as pending before the token transfer and marked
 * claimed after it. A failed transfer removes the journal entry, so the
 * claim leaves no trace. Root rotation never clears the record.
 */
class ClaimLedger {
public:
  ClaimLedger(std::unique_ptr<ClaimStore> store, TokenLedger &tokens,
              const PauseSwitch &pauseSwitch, ClaimEventLog &events,
              size_t maxProofDepth = DEFAULT_MAX_PROOF_DEPTH);

  ClaimLedger(const ClaimLedger &) = delete;
  ClaimLedger &operator=(const ClaimLedger &) = delete;

  /**
   * @brief Redeem the caller's entitlement.
   *
   * On success the amount has been transferred and ClaimCompleted recorded.
   * Failures: ClaimsPaused, InvalidProof, AlreadyClaimed, TransferFailed,
   * StorageFailed (journal could not be written; nothing transferred).
   */
  ClaimResult claim(const Address &caller, Amount amount,
                    const ProofPath &proof);

  ClaimResult claim(const Address &caller, Amount amount,
                    const std::vector<Digest> &proof);

  /**
   * @brief Replace the active root. Performs no permission check; use
   * AdminSurface::setRoot for administrative rotation.
   * @throw std::runtime_error If the new root cannot be persisted.
   */
  void rotateRoot(const Digest &newRoot);

  /**
   * @brief Resolve a pending redemption left by an interrupted claim.
   * @param paid true if the transfer is known to have happened.
   * @return NotPending if the recipient has no pending record,
   *         StorageFailed if the resolution cannot be written.
   */
  ErrorKind reconcile(const Address &recipient, bool paid);

  Digest currentRoot() const;
  bool isClaimed(const Address &recipient) const;
  size_t claimedCount() const;
  std::vector<Address> pendingClaims() const;
  size_t maxProofDepth() const { return maxProofDepth_; }

  const TokenLedger &tokenLedger() const { return tokens_; }

private:
  ClaimResult reject(const Address &caller, Amount amount, ErrorKind why);

  mutable std::recursive_mutex mutex_;
  std::unique_ptr<ClaimStore> store_;
  TokenLedger &tokens_;
  const PauseSwitch &pause_;
  ClaimEventLog &events_;
  size_t maxProofDepth_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_CLAIM_LEDGER_H
