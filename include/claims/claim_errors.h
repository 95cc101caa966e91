#pragma once
#ifndef MERKLECLAIM_CLAIM_ERRORS_H
#define MERKLECLAIM_CLAIM_ERRORS_H

namespace merkleclaim {

/**
 * @brief Outcome of a claim or administrative operation.
 *
 * None of these are fatal; they are returned to the caller as values.
 */
enum class ErrorKind {
  None,
  InvalidProof,   ///< Proof does not reconstruct the current root
  AlreadyClaimed, ///< Recipient already redeemed (or has a pending redemption)
  ClaimsPaused,   ///< Claims are switched off
  Unauthorized,   ///< Caller lacks authority for the action
  TransferFailed, ///< Token ledger rejected the transfer
  ProtectedAsset, ///< Sweep targeted the claim token itself
  NotPending,     ///< Reconcile on a recipient with no pending redemption
  StorageFailed   ///< Durable state could not be written
};

const char *toString(ErrorKind kind);

} // namespace merkleclaim

#endif // MERKLECLAIM_CLAIM_ERRORS_H
