#include "claims/claim_store.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace merkleclaim {

namespace {

void replaceFile(const std::string &path, const std::string &contents) {
  namespace fs = std::filesystem;
  fs::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
  }

  std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs.is_open()) {
      throw std::runtime_error("Could not open " + tmp + " for writing");
    }
    ofs << contents;
    ofs.flush();
    if (!ofs.good()) {
      throw std::runtime_error("Write to " + tmp + " failed");
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    throw std::runtime_error("Could not replace " + path + ": " +
                             ec.message());
  }
}

} // namespace

ClaimStore::ClaimStore(std::string rootPath, std::string redemptionsPath)
    : rootPath_(std::move(rootPath)),
      redemptionsPath_(std::move(redemptionsPath)) {}

void ClaimStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!persistent())
    return;

  Digest root{};
  std::ifstream rootIfs(rootPath_);
  if (rootIfs.is_open()) {
    std::string line;
    std::getline(rootIfs, line);
    if (!line.empty()) {
      try {
        root = digestFromHex(line);
      } catch (const std::invalid_argument &e) {
        throw std::runtime_error("Corrupt root file " + rootPath_ + ": " +
                                 e.what());
      }
    }
  }

  std::unordered_map<Address, RedemptionState, AddressHash> records;
  std::ifstream recIfs(redemptionsPath_);
  if (recIfs.is_open()) {
    std::string line;
    size_t lineNo = 0;
    while (std::getline(recIfs, line)) {
      ++lineNo;
      if (line.empty())
        continue;
      size_t pos = line.find(RECORD_SEPARATOR);
      if (pos == std::string::npos || pos + 2 != line.size()) {
        throw std::runtime_error("Malformed redemption record at " +
                                 redemptionsPath_ + ":" +
                                 std::to_string(lineNo));
      }
      Address recipient{};
      try {
        recipient = addressFromHex(line.substr(0, pos));
      } catch (const std::invalid_argument &e) {
        throw std::runtime_error("Malformed redemption record at " +
                                 redemptionsPath_ + ":" +
                                 std::to_string(lineNo) + ": " + e.what());
      }
      char flag = line[pos + 1];
      if (flag == 'C') {
        records[recipient] = RedemptionState::Claimed;
      } else if (flag == 'P') {
        records[recipient] = RedemptionState::Pending;
      } else {
        throw std::runtime_error("Unknown redemption state '" +
                                 std::string(1, flag) + "' at " +
                                 redemptionsPath_ + ":" +
                                 std::to_string(lineNo));
      }
    }
  }

  root_ = root;
  records_ = std::move(records);
}

Digest ClaimStore::root() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return root_;
}

void ClaimStore::setRoot(const Digest &root) {
  std::lock_guard<std::mutex> lock(mutex_);
  Digest previous = root_;
  root_ = root;
  try {
    saveRootLocked();
  } catch (...) {
    root_ = previous;
    throw;
  }
}

std::optional<RedemptionState>
ClaimStore::state(const Address &recipient) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(recipient);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

bool ClaimStore::markPending(const Address &recipient) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!records_.emplace(recipient, RedemptionState::Pending).second)
    return false;
  try {
    saveRecordsLocked();
  } catch (...) {
    records_.erase(recipient);
    throw;
  }
  return true;
}

void ClaimStore::markClaimed(const Address &recipient) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[recipient] = RedemptionState::Claimed;
  saveRecordsLocked();
}

void ClaimStore::erase(const Address &recipient) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.erase(recipient);
  saveRecordsLocked();
}

size_t ClaimStore::claimedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto &kv : records_) {
    if (kv.second == RedemptionState::Claimed)
      ++n;
  }
  return n;
}

std::vector<Address> ClaimStore::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Address> out;
  for (const auto &kv : records_) {
    if (kv.second == RedemptionState::Pending)
      out.push_back(kv.first);
  }
  return out;
}

void ClaimStore::saveRootLocked() const {
  if (!persistent())
    return;
  replaceFile(rootPath_, toHex(root_) + "\n");
}

void ClaimStore::saveRecordsLocked() const {
  if (!persistent())
    return;
  std::string contents;
  contents.reserve(records_.size() * (ADDRESS_SIZE * 2 + 3));
  for (const auto &kv : records_) {
    contents += toHex(kv.first);
    contents += RECORD_SEPARATOR;
    contents += kv.second == RedemptionState::Claimed ? 'C' : 'P';
    contents += '\n';
  }
  replaceFile(redemptionsPath_, contents);
}

} // namespace merkleclaim
