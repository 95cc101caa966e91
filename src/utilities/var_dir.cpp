#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace merkleclaim {

static std::string varDir = [] {
  const char *env = std::getenv("MERKLECLAIM_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/merkleclaim"))
    return std::string("/var/merkleclaim");
  return std::string("var/merkleclaim");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string rootPath() { return getVarDir() + "/root.dat"; }

std::string redemptionsPath() { return getVarDir() + "/redemptions.dat"; }

} // namespace merkleclaim
