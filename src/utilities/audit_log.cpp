#include "utilities/audit_log.hpp"
#include "utilities/hasher.hpp"
#include "utilities/logger.h"

#include <stdexcept>

namespace merkleclaim {

namespace {

// Length-prefixed so adjacent fields cannot run into each other.
void ingestField(Hasher &h, const std::string &field) {
  uint32_t len = static_cast<uint32_t>(field.size());
  std::array<uint8_t, 4> prefix{static_cast<uint8_t>(len >> 24),
                                static_cast<uint8_t>(len >> 16),
                                static_cast<uint8_t>(len >> 8),
                                static_cast<uint8_t>(len)};
  h.ingest(prefix);
  h.ingest(reinterpret_cast<const uint8_t *>(field.data()), field.size());
}

} // namespace

const char *ClaimEventLog::typeName(EventType type) {
  switch (type) {
  case EventType::ClaimCompleted:
    return "CLAIM_COMPLETED";
  case EventType::ClaimReconciled:
    return "CLAIM_RECONCILED";
  case EventType::RootRotated:
    return "ROOT_ROTATED";
  case EventType::Paused:
    return "PAUSED";
  case EventType::Unpaused:
    return "UNPAUSED";
  case EventType::AssetSwept:
    return "ASSET_SWEPT";
  case EventType::AuthorityNominated:
    return "AUTHORITY_NOMINATED";
  case EventType::AuthorityTransferred:
    return "AUTHORITY_TRANSFERRED";
  }
  return "UNKNOWN";
}

std::string ClaimEventLog::chainHash(const std::string &prev, EventType type,
                                     const std::string &subject,
                                     const std::string &detail,
                                     std::time_t ts) {
  Hasher h;
  ingestField(h, prev);
  ingestField(h, typeName(type));
  ingestField(h, subject);
  ingestField(h, detail);
  ingestField(h, std::to_string(static_cast<long long>(ts)));
  return toHex(h.finalize());
}

std::string ClaimEventLog::record(EventType type, const std::string &subject,
                                  const std::string &detail) {
  Event e;
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::time_t ts = std::time(nullptr);
    std::string prev = log_.empty() ? std::string() : log_.back().hash;
    e = Event{type, subject, detail, ts, prev,
              chainHash(prev, type, subject, detail, ts)};
    log_.push_back(e);
    listeners = listeners_;
  }
  // The event is already committed; a failing listener must not undo that.
  for (const auto &l : listeners) {
    try {
      l(e);
    } catch (const std::exception &ex) {
      Logger::getInstance().log(LogLevel::ERROR, "events",
                                std::string("Listener for ") + typeName(type) +
                                    " failed: " + ex.what());
    }
  }
  return e.hash;
}

void ClaimEventLog::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

std::vector<ClaimEventLog::Event> ClaimEventLog::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return log_;
}

size_t ClaimEventLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return log_.size();
}

bool ClaimEventLog::verify() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string prev;
  for (const auto &e : log_) {
    if (e.prevHash != prev)
      return false;
    if (chainHash(prev, e.type, e.subject, e.detail, e.ts) != e.hash)
      return false;
    prev = e.hash;
  }
  return true;
}

void ClaimEventLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  log_.clear();
}

} // namespace merkleclaim
