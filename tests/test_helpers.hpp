#pragma once
#ifndef MERKLECLAIM_TEST_HELPERS_HPP
#define MERKLECLAIM_TEST_HELPERS_HPP

#include "utilities/digest.hpp"
#include "utilities/var_dir.hpp"

#include <filesystem>
#include <string>

namespace testutil {

// Address whose every byte is @p fill.
inline merkleclaim::Address addr(uint8_t fill) {
  merkleclaim::Address a{};
  a.fill(fill);
  return a;
}

// Fresh, empty directory under the test var dir.
inline std::string freshDir(const std::string &name) {
  namespace fs = std::filesystem;
  fs::path p = fs::path(merkleclaim::getVarDir()) / name;
  fs::remove_all(p);
  fs::create_directories(p);
  return p.string();
}

} // namespace testutil

#endif // MERKLECLAIM_TEST_HELPERS_HPP
