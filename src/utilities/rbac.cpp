#include "utilities/rbac.h"
#include "utilities/logger.h"

#include <map>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

using namespace merkleclaim;

namespace {

struct ParsedPolicy {
  std::optional<Address> owner;
  std::unordered_map<Address, std::string, AddressHash> userRoles;
  std::unordered_map<std::string, std::unordered_set<Action>> rolePerms;
};

// Throws on any malformed entry so a bad file never half-applies.
ParsedPolicy parsePolicy(const YAML::Node &config) {
  ParsedPolicy p;
  if (config["owner"]) {
    p.owner = addressFromHex(config["owner"].as<std::string>());
  }
  if (config["roles"]) {
    for (auto it : config["roles"].as<std::map<std::string, YAML::Node>>()) {
      auto &perms = p.rolePerms[it.first];
      for (const auto &perm : it.second) {
        Action a;
        if (!actionFromName(perm.as<std::string>(), a)) {
          throw std::invalid_argument("Unknown action '" +
                                      perm.as<std::string>() + "' in role " +
                                      it.first);
        }
        perms.insert(a);
      }
    }
  }
  if (config["users"]) {
    for (auto it : config["users"].as<std::map<std::string, std::string>>()) {
      p.userRoles[addressFromHex(it.first)] = it.second;
    }
  }
  return p;
}

} // namespace

namespace merkleclaim {

const char *actionName(Action action) {
  switch (action) {
  case Action::SetRoot:
    return "set_root";
  case Action::Pause:
    return "pause";
  case Action::Unpause:
    return "unpause";
  case Action::Sweep:
    return "sweep";
  case Action::Reconcile:
    return "reconcile";
  case Action::TransferAuthority:
    return "transfer_authority";
  }
  return "unknown";
}

bool actionFromName(const std::string &name, Action &out) {
  for (Action a : {Action::SetRoot, Action::Pause, Action::Unpause,
                   Action::Sweep, Action::Reconcile,
                   Action::TransferAuthority}) {
    if (name == actionName(a)) {
      out = a;
      return true;
    }
  }
  return false;
}

} // namespace merkleclaim

RolePolicy::RolePolicy(const Address &owner) : owner_(owner) {}

bool RolePolicy::loadFromFile(const std::string &path) {
  try {
    ParsedPolicy p = parsePolicy(YAML::LoadFile(path));
    std::lock_guard<std::mutex> lock(mutex_);
    if (p.owner)
      owner_ = p.owner;
    userRoles_ = std::move(p.userRoles);
    rolePerms_ = std::move(p.rolePerms);
    return true;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "rbac",
                              "Failed to load policy " + path + ": " +
                                  e.what());
    return false;
  }
}

bool RolePolicy::loadFromString(const std::string &yaml) {
  try {
    ParsedPolicy p = parsePolicy(YAML::Load(yaml));
    std::lock_guard<std::mutex> lock(mutex_);
    if (p.owner)
      owner_ = p.owner;
    userRoles_ = std::move(p.userRoles);
    rolePerms_ = std::move(p.rolePerms);
    return true;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "rbac",
                              std::string("Failed to parse policy: ") +
                                  e.what());
    return false;
  }
}

void RolePolicy::allow(const std::string &role, Action action) {
  std::lock_guard<std::mutex> lock(mutex_);
  rolePerms_[role].insert(action);
}

void RolePolicy::assignRole(const Address &user, const std::string &role) {
  std::lock_guard<std::mutex> lock(mutex_);
  userRoles_[user] = role;
}

bool RolePolicy::isAuthorityFor(Action action, const Address &caller) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (owner_ && *owner_ == caller)
    return true;
  auto uIt = userRoles_.find(caller);
  if (uIt == userRoles_.end())
    return false;
  auto rIt = rolePerms_.find(uIt->second);
  if (rIt == rolePerms_.end())
    return false;
  return rIt->second.count(action) > 0;
}

std::optional<Address> RolePolicy::owner() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return owner_;
}

std::optional<Address> RolePolicy::pendingOwner() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pendingOwner_;
}

bool RolePolicy::nominate(const Address &caller, const Address &nominee) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!owner_ || *owner_ != caller)
    return false;
  pendingOwner_ = nominee;
  return true;
}

bool RolePolicy::accept(const Address &caller) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pendingOwner_ || *pendingOwner_ != caller)
    return false;
  owner_ = pendingOwner_;
  pendingOwner_.reset();
  return true;
}
