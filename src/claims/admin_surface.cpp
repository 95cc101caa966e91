#include "claims/admin_surface.h"
#include "utilities/logger.h"

#include <stdexcept>

namespace merkleclaim {

namespace {
const char *const COMPONENT = "admin";
}

AdminSurface::AdminSurface(ClaimLedger &ledger, RolePolicy &policy,
                           PauseSwitch &pauseSwitch, ClaimEventLog &events)
    : ledger_(ledger), policy_(policy), pause_(pauseSwitch), events_(events) {}

bool AdminSurface::permitted(Action action, const Address &caller) const {
  const AccessControl &acl = policy_;
  if (acl.isAuthorityFor(action, caller))
    return true;
  Logger::getInstance().log(LogLevel::WARN, COMPONENT,
                            std::string("Unauthorized ") + actionName(action) +
                                " by " + toHex(caller));
  return false;
}

ErrorKind AdminSurface::setRoot(const Address &caller, const Digest &newRoot) {
  if (!permitted(Action::SetRoot, caller))
    return ErrorKind::Unauthorized;
  try {
    ledger_.rotateRoot(newRoot);
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                              std::string("Root rotation failed: ") + e.what());
    return ErrorKind::StorageFailed;
  }
  return ErrorKind::None;
}

ErrorKind AdminSurface::pause(const Address &caller) {
  if (!permitted(Action::Pause, caller))
    return ErrorKind::Unauthorized;
  pause_.pause();
  events_.record(ClaimEventLog::EventType::Paused, toHex(caller), "");
  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Claims paused by " + toHex(caller));
  return ErrorKind::None;
}

ErrorKind AdminSurface::unpause(const Address &caller) {
  if (!permitted(Action::Unpause, caller))
    return ErrorKind::Unauthorized;
  pause_.unpause();
  events_.record(ClaimEventLog::EventType::Unpaused, toHex(caller), "");
  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Claims resumed by " + toHex(caller));
  return ErrorKind::None;
}

ErrorKind AdminSurface::sweepForeignAsset(const Address &caller,
                                          TokenLedger &asset,
                                          const Address &to, Amount amount) {
  if (!permitted(Action::Sweep, caller))
    return ErrorKind::Unauthorized;
  const TokenLedger &claimToken = ledger_.tokenLedger();
  if (&asset == &claimToken || asset.symbol() == claimToken.symbol())
    return ErrorKind::ProtectedAsset;

  bool ok = false;
  try {
    ok = asset.transfer(to, amount);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                              "Sweep of " + asset.symbol() +
                                  " threw: " + e.what());
  }
  if (!ok)
    return ErrorKind::TransferFailed;

  events_.record(ClaimEventLog::EventType::AssetSwept, toHex(to),
                 asset.symbol() + ":" + std::to_string(amount));
  return ErrorKind::None;
}

ErrorKind AdminSurface::nominateAuthority(const Address &caller,
                                          const Address &nominee) {
  if (!permitted(Action::TransferAuthority, caller) ||
      !policy_.nominate(caller, nominee))
    return ErrorKind::Unauthorized;
  events_.record(ClaimEventLog::EventType::AuthorityNominated, toHex(caller),
                 toHex(nominee));
  return ErrorKind::None;
}

ErrorKind AdminSurface::acceptAuthority(const Address &caller) {
  if (!policy_.accept(caller)) {
    Logger::getInstance().log(LogLevel::WARN, COMPONENT,
                              "Authority accept refused for " + toHex(caller));
    return ErrorKind::Unauthorized;
  }
  events_.record(ClaimEventLog::EventType::AuthorityTransferred, toHex(caller),
                 "");
  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Authority transferred to " + toHex(caller));
  return ErrorKind::None;
}

ErrorKind AdminSurface::reconcile(const Address &caller,
                                  const Address &recipient, bool paid) {
  if (!permitted(Action::Reconcile, caller))
    return ErrorKind::Unauthorized;
  return ledger_.reconcile(recipient, paid);
}

} // namespace merkleclaim
