#include "utilities/config.h"

#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace merkleclaim {

namespace {

LedgerConfig parseConfig(const YAML::Node &node, const LedgerConfig &base,
                         const std::filesystem::path &baseDir) {
  LedgerConfig c = base;
  if (node["state_dir"])
    c.stateDir = node["state_dir"].as<std::string>();
  if (node["log_file"])
    c.logFile = node["log_file"].as<std::string>();
  if (node["log_level"]) {
    std::string lvl = node["log_level"].as<std::string>();
    if (!Logger::levelFromString(lvl, c.logLevel))
      throw std::invalid_argument("Unknown log_level '" + lvl + "'");
  }
  if (node["max_proof_depth"]) {
    int depth = node["max_proof_depth"].as<int>();
    if (depth <= 0 || depth > 256)
      throw std::invalid_argument("max_proof_depth must be in 1..256");
    c.maxProofDepth = static_cast<size_t>(depth);
  }
  if (node["root"])
    c.root = digestFromHex(node["root"].as<std::string>());
  if (node["policy"]) {
    std::filesystem::path p(node["policy"].as<std::string>());
    if (p.is_relative() && !baseDir.empty())
      p = baseDir / p;
    c.policyPath = p.string();
  }
  return c;
}

} // namespace

bool LedgerConfig::loadFromFile(const std::string &path) {
  try {
    *this = parseConfig(YAML::LoadFile(path), *this,
                        std::filesystem::path(path).parent_path());
    return true;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "config",
                              "Failed to load config " + path + ": " +
                                  e.what());
    return false;
  }
}

bool LedgerConfig::loadFromString(const std::string &yaml) {
  try {
    *this = parseConfig(YAML::Load(yaml), *this, {});
    return true;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "config",
                              std::string("Failed to parse config: ") +
                                  e.what());
    return false;
  }
}

} // namespace merkleclaim
