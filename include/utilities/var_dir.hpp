#pragma once

#include <string>

namespace merkleclaim {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string rootPath();
std::string redemptionsPath();

} // namespace merkleclaim
