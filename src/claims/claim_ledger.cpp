#include "claims/claim_ledger.h"
#include "utilities/logger.h"

#include <stdexcept>

namespace merkleclaim {

namespace {
const char *const COMPONENT = "claim_ledger";
}

ClaimLedger::ClaimLedger(std::unique_ptr<ClaimStore> store,
                         TokenLedger &tokens, const PauseSwitch &pauseSwitch,
                         ClaimEventLog &events, size_t maxProofDepth)
    : store_(std::move(store)), tokens_(tokens), pause_(pauseSwitch),
      events_(events), maxProofDepth_(maxProofDepth) {
  if (!store_) {
    throw std::invalid_argument("ClaimLedger requires a ClaimStore");
  }
}

ClaimResult ClaimLedger::reject(const Address &caller, Amount amount,
                                ErrorKind why) {
  Logger::getInstance().log(why == ErrorKind::TransferFailed ||
                                    why == ErrorKind::StorageFailed
                                ? LogLevel::ERROR
                                : LogLevel::WARN,
                            COMPONENT,
                            std::string("Claim rejected (") + toString(why) +
                                ") recipient=" + toHex(caller) +
                                " amount=" + std::to_string(amount));
  ClaimResult r;
  r.error = why;
  return r;
}

ClaimResult ClaimLedger::claim(const Address &caller, Amount amount,
                               const std::vector<Digest> &proof) {
  return claim(caller, amount, MerkleVerifier::toProofPath(proof));
}

ClaimResult ClaimLedger::claim(const Address &caller, Amount amount,
                               const ProofPath &proof) {
  if (!pause_.isAcceptingClaims()) {
    return reject(caller, amount, ErrorKind::ClaimsPaused);
  }

  ClaimResult result;
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Digest leaf = MerkleVerifier::encodeLeaf(caller, amount);
    if (!MerkleVerifier::verify(leaf, proof, store_->root(), maxProofDepth_)) {
      return reject(caller, amount, ErrorKind::InvalidProof);
    }

    if (store_->state(caller)) {
      return reject(caller, amount, ErrorKind::AlreadyClaimed);
    }

    // Journal before any externally visible effect.
    try {
      if (!store_->markPending(caller)) {
        return reject(caller, amount, ErrorKind::AlreadyClaimed);
      }
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                                std::string("Journal write failed: ") +
                                    e.what());
      return reject(caller, amount, ErrorKind::StorageFailed);
    }

    bool transferred = false;
    try {
      transferred = tokens_.transfer(caller, amount);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                                std::string("Token transfer threw: ") +
                                    e.what());
    }

    if (!transferred) {
      try {
        store_->erase(caller);
      } catch (const std::exception &e) {
        // The in-memory record is already gone; the on-disk pending entry
        // is left for reconcile().
        Logger::getInstance().log(
            LogLevel::ERROR, COMPONENT,
            "Rollback of pending redemption for " + toHex(caller) +
                " was not persisted: " + e.what());
      }
      return reject(caller, amount, ErrorKind::TransferFailed);
    }

    try {
      store_->markClaimed(caller);
    } catch (const std::exception &e) {
      // Funds moved; the pending journal entry still blocks a second claim.
      Logger::getInstance().log(
          LogLevel::ERROR, COMPONENT,
          "Claim for " + toHex(caller) +
              " transferred but completion was not persisted: " + e.what());
    }

    result.instruction = TransferInstruction{caller, amount};
  }

  events_.record(ClaimEventLog::EventType::ClaimCompleted, toHex(caller),
                 std::to_string(amount));
  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Claim completed recipient=" + toHex(caller) +
                                " amount=" + std::to_string(amount));
  return result;
}

void ClaimLedger::rotateRoot(const Digest &newRoot) {
  Digest oldRoot;
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    oldRoot = store_->root();
    store_->setRoot(newRoot);
  }
  events_.record(ClaimEventLog::EventType::RootRotated, toHex(oldRoot),
                 toHex(newRoot));
  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Root rotated " + toHex(oldRoot) + " -> " +
                                toHex(newRoot));
}

ErrorKind ClaimLedger::reconcile(const Address &recipient, bool paid) {
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto st = store_->state(recipient);
    if (!st || *st != RedemptionState::Pending) {
      return ErrorKind::NotPending;
    }
    try {
      if (paid) {
        store_->markClaimed(recipient);
      } else {
        store_->erase(recipient);
      }
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR, COMPONENT,
                                "Reconcile for " + toHex(recipient) +
                                    " was not persisted: " + e.what());
      return ErrorKind::StorageFailed;
    }
  }
  events_.record(ClaimEventLog::EventType::ClaimReconciled, toHex(recipient),
                 paid ? "paid" : "reverted");
  return ErrorKind::None;
}

Digest ClaimLedger::currentRoot() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_->root();
}

bool ClaimLedger::isClaimed(const Address &recipient) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto st = store_->state(recipient);
  return st && *st == RedemptionState::Claimed;
}

size_t ClaimLedger::claimedCount() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_->claimedCount();
}

std::vector<Address> ClaimLedger::pendingClaims() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return store_->pending();
}

} // namespace merkleclaim
