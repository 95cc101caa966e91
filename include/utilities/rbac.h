#pragma once
#ifndef MERKLECLAIM_RBAC_H
#define MERKLECLAIM_RBAC_H

#include "utilities/digest.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace merkleclaim {

/// Privileged operations gated by an AccessControl collaborator.
enum class Action { SetRoot, Pause, Unpause, Sweep, Reconcile, TransferAuthority };

const char *actionName(Action action);

/// Parse the policy-file spelling ("set_root", "pause", ...).
bool actionFromName(const std::string &name, Action &out);

/**
 * @brief Single capability check consulted by every privileged operation.
 */
class AccessControl {
public:
  virtual ~AccessControl() = default;
  virtual bool isAuthorityFor(Action action, const Address &caller) const = 0;
};

/**
 * @brief Role based access control loaded from a YAML policy.
 *
 * @code
 * owner: "0x..."
 * roles:
 *   admin: [set_root, pause, unpause, sweep, reconcile]
 *   guardian: [pause]
 * users:
 *   "0x...": guardian
 * @endcode
 *
 * The owner holds every action. Ownership moves in two steps: the owner
 * nominates, the nominee accepts.
 */
class RolePolicy : public AccessControl {
public:
  RolePolicy() = default;
  explicit RolePolicy(const Address &owner);

  /**
   * @brief Load policy from a YAML file.
   * @param path Path to YAML file.
   * @return True on success. On failure the current policy is unchanged.
   */
  bool loadFromFile(const std::string &path);

  /** Load policy from YAML text. */
  bool loadFromString(const std::string &yaml);

  void allow(const std::string &role, Action action);
  void assignRole(const Address &user, const std::string &role);

  bool isAuthorityFor(Action action, const Address &caller) const override;

  std::optional<Address> owner() const;
  std::optional<Address> pendingOwner() const;

  /**
   * @brief Record @p nominee as the pending owner.
   * @return false unless @p caller is the current owner.
   */
  bool nominate(const Address &caller, const Address &nominee);

  /**
   * @brief Complete a handoff started by nominate().
   * @return false unless @p caller is the pending owner.
   */
  bool accept(const Address &caller);

private:
  mutable std::mutex mutex_;
  std::optional<Address> owner_;
  std::optional<Address> pendingOwner_;
  std::unordered_map<Address, std::string, AddressHash> userRoles_;
  std::unordered_map<std::string, std::unordered_set<Action>> rolePerms_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_RBAC_H
