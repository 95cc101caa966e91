#pragma once
#ifndef MERKLECLAIM_CONFIG_H
#define MERKLECLAIM_CONFIG_H

#include "utilities/digest.hpp"
#include "utilities/logger.h"
#include "utilities/merkle_tree.hpp"

#include <optional>
#include <string>

namespace merkleclaim {

/**
 * @brief Settings for a claim engine instance, read from YAML.
 *
 * Keys (all optional): state_dir, log_file, log_level, max_proof_depth,
 * root, policy. A relative policy path is resolved against the directory
 * of the config file.
 */
struct LedgerConfig {
  std::string stateDir;
  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;
  size_t maxProofDepth = DEFAULT_MAX_PROOF_DEPTH;
  std::optional<Digest> root;
  std::string policyPath;

  /**
   * @brief Load settings from a YAML file.
   * @return True on success. On failure the config is unchanged.
   */
  bool loadFromFile(const std::string &path);

  /** Load settings from YAML text; relative paths stay as written. */
  bool loadFromString(const std::string &yaml);
};

} // namespace merkleclaim

#endif // MERKLECLAIM_CONFIG_H
