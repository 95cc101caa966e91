#include "claims/admin_surface.h"
#include "claims/claim_ledger.h"
#include "claims/claim_store.h"
#include "claims/token_ledger.h"
#include "utilities/config.h"
#include "utilities/logger.h"
#include "utilities/merkle_tree.hpp"
#include "utilities/rbac.h"
#include "utilities/var_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace merkleclaim;

static void usage() {
  std::cout
      << "Usage: merkleclaim_ctl leaf <address> <amount>\n"
      << "       merkleclaim_ctl build <entitlements_file>\n"
      << "       merkleclaim_ctl verify <leaf> <root> [sibling...]\n"
      << "       merkleclaim_ctl status [config]\n"
      << "       merkleclaim_ctl set-root <caller> <root> [config]\n";
}

static bool loadConfig(const char *path, LedgerConfig &config) {
  if (path && !config.loadFromFile(path)) {
    std::cerr << "Could not load config " << path << std::endl;
    return false;
  }
  if (config.stateDir.empty())
    config.stateDir = getVarDir();
  setVarDir(config.stateDir);
  if (!config.logFile.empty()) {
    std::filesystem::path logPath(config.logFile);
    if (logPath.has_parent_path())
      std::filesystem::create_directories(logPath.parent_path());
    Logger::init(config.logFile, config.logLevel);
  }
  return true;
}

// A configured root only seeds a store that has never had one.
static std::unique_ptr<ClaimStore> openStore(const LedgerConfig &config) {
  auto store = std::make_unique<ClaimStore>(rootPath(), redemptionsPath());
  store->load();
  if (config.root && store->root() == Digest{}) {
    store->setRoot(*config.root);
    Logger::getInstance().log(LogLevel::INFO, "ctl",
                              "Initial root " + toHex(*config.root));
  }
  return store;
}

static int leaf_command(const std::string &address, const std::string &amount) {
  Digest leaf = MerkleVerifier::encodeLeaf(addressFromHex(address),
                                           amountFromString(amount));
  std::cout << toHex(leaf) << std::endl;
  return 0;
}

// One entitlement per line: `<address> <amount>`. Blank lines and lines
// starting with '#' are skipped.
static int build_command(const std::string &file) {
  std::ifstream in(file);
  if (!in.is_open()) {
    std::cerr << "Entitlements file not found: " << file << std::endl;
    return 1;
  }
  std::vector<Entitlement> entitlements;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#')
      continue;
    std::istringstream iss(line);
    std::string addr;
    std::string amount;
    std::string extra;
    if (!(iss >> addr >> amount) || (iss >> extra)) {
      std::cerr << "Malformed line: " << line << std::endl;
      return 1;
    }
    entitlements.push_back(
        {addressFromHex(addr), amountFromString(amount)});
  }

  MerkleTree tree(entitlements);
  std::cout << "root " << toHex(tree.root()) << "\n";
  std::cout << "depth " << tree.depth() << "\n";
  for (const auto &e : entitlements) {
    std::cout << toHex(e.recipient) << ' ' << e.amount;
    for (const auto &sibling : tree.proof(e.recipient, e.amount)) {
      std::cout << ' ' << toHex(sibling);
    }
    std::cout << "\n";
  }
  return 0;
}

static int verify_command(int argc, char **argv) {
  Digest leaf = digestFromHex(argv[2]);
  Digest root = digestFromHex(argv[3]);
  ProofPath proof;
  for (int i = 4; i < argc; ++i) {
    proof.push_back(bytesFromHex(argv[i]));
  }
  bool ok = MerkleVerifier::verify(leaf, proof, root);
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return ok ? 0 : 1;
}

static int status_command(const char *configPath) {
  LedgerConfig config;
  if (!loadConfig(configPath, config))
    return 1;
  auto store = openStore(config);
  std::cout << "state_dir\t" << config.stateDir << "\n";
  std::cout << "root\t" << toHex(store->root()) << "\n";
  std::cout << "max_proof_depth\t" << config.maxProofDepth << "\n";
  std::cout << "claimed\t" << store->claimedCount() << "\n";
  auto pending = store->pending();
  std::cout << "pending\t" << pending.size() << "\n";
  for (const auto &p : pending) {
    std::cout << "  " << toHex(p) << "\n";
  }
  return 0;
}

static int set_root_command(const std::string &caller,
                            const std::string &root, const char *configPath) {
  LedgerConfig config;
  if (!loadConfig(configPath, config))
    return 1;
  RolePolicy policy;
  if (config.policyPath.empty() || !policy.loadFromFile(config.policyPath)) {
    std::cerr << "A policy file is required for set-root" << std::endl;
    return 1;
  }

  InMemoryTokenLedger tokens("CLAIM");
  PauseSwitch pauseSwitch;
  ClaimEventLog events;
  ClaimLedger ledger(openStore(config), tokens, pauseSwitch, events,
                     config.maxProofDepth);
  AdminSurface admin(ledger, policy, pauseSwitch, events);

  ErrorKind rc = admin.setRoot(addressFromHex(caller), digestFromHex(root));
  if (rc != ErrorKind::None) {
    std::cerr << "set-root failed: " << toString(rc) << std::endl;
    return 1;
  }
  std::cout << "Root set to " << toHex(ledger.currentRoot()) << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  if (argc < 2) {
    usage();
    return 1;
  }
  std::string cmd = argv[1];
  try {
    if (cmd == "leaf" && argc == 4) {
      return leaf_command(argv[2], argv[3]);
    } else if (cmd == "build" && argc == 3) {
      return build_command(argv[2]);
    } else if (cmd == "verify" && argc >= 4) {
      return verify_command(argc, argv);
    } else if (cmd == "status" && argc <= 3) {
      return status_command(argc == 3 ? argv[2] : nullptr);
    } else if (cmd == "set-root" && (argc == 4 || argc == 5)) {
      return set_root_command(argv[2], argv[3], argc == 5 ? argv[4] : nullptr);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
