#pragma once
#ifndef MERKLECLAIM_ADMIN_SURFACE_H
#define MERKLECLAIM_ADMIN_SURFACE_H

#include "claims/claim_errors.h"
#include "claims/claim_ledger.h"
#include "claims/pause_switch.h"
#include "claims/token_ledger.h"
#include "utilities/audit_log.hpp"
#include "utilities/rbac.h"

namespace merkleclaim {

/**
 * @brief Privileged operations on the claim engine.
 *
 * Every call checks the caller against the RolePolicy first and returns
 * Unauthorized without side effects when the check fails.
 */
class AdminSurface {
public:
  AdminSurface(ClaimLedger &ledger, RolePolicy &policy,
               PauseSwitch &pauseSwitch, ClaimEventLog &events);

  ErrorKind setRoot(const Address &caller, const Digest &newRoot);

  ErrorKind pause(const Address &caller);
  ErrorKind unpause(const Address &caller);

  /**
   * @brief Move tokens of another asset that were sent to the engine.
   *
   * The claim token itself cannot be swept (ProtectedAsset), whether passed
   * as the ledger's own instance or another one with the same symbol.
   */
  ErrorKind sweepForeignAsset(const Address &caller, TokenLedger &asset,
                              const Address &to, Amount amount);

  /** First half of an ownership handoff; only the owner may nominate. */
  ErrorKind nominateAuthority(const Address &caller, const Address &nominee);

  /** Second half; only the nominee may accept. */
  ErrorKind acceptAuthority(const Address &caller);

  ErrorKind reconcile(const Address &caller, const Address &recipient,
                      bool paid);

private:
  bool permitted(Action action, const Address &caller) const;

  ClaimLedger &ledger_;
  RolePolicy &policy_;
  PauseSwitch &pause_;
  ClaimEventLog &events_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_ADMIN_SURFACE_H
