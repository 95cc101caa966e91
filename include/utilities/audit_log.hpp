#ifndef MERKLECLAIM_AUDIT_LOG_HPP
#define MERKLECLAIM_AUDIT_LOG_HPP

#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace merkleclaim {

/**
 * @brief Hash-chained record of claim engine notifications.
 *
 * Each event is hashed together with the previous event's hash so that
 * any later edit to the history is detectable by verify(). Listeners are
 * called after the event is appended, outside the log's lock. A listener
 * that throws is logged and skipped; the remaining listeners still run.
 */
class ClaimEventLog {
public:
  enum class EventType {
    ClaimCompleted,
    ClaimReconciled,
    RootRotated,
    Paused,
    Unpaused,
    AssetSwept,
    AuthorityNominated,
    AuthorityTransferred
  };

  /**
   * @brief Representation of a single notification.
   */
  struct Event {
    EventType type;       ///< What happened
    std::string subject;  ///< Primary party (recipient, caller) as hex
    std::string detail;   ///< Type-specific payload (amount, new root, ...)
    std::time_t ts;       ///< Event timestamp
    std::string prevHash; ///< Hash of previous event
    std::string hash;     ///< Hash of this event
  };

  using Listener = std::function<void(const Event &)>;

  ClaimEventLog() = default;
  ClaimEventLog(const ClaimEventLog &) = delete;
  ClaimEventLog &operator=(const ClaimEventLog &) = delete;

  /** Append an event and notify listeners. Returns the event hash. */
  std::string record(EventType type, const std::string &subject,
                     const std::string &detail);

  void subscribe(Listener listener);

  /** Snapshot of recorded events. */
  std::vector<Event> events() const;

  size_t size() const;

  /** Verify the integrity of the chain. */
  bool verify() const;

  /** Reset the log (primarily for tests). */
  void clear();

  static const char *typeName(EventType type);

private:
  static std::string chainHash(const std::string &prev, EventType type,
                               const std::string &subject,
                               const std::string &detail, std::time_t ts);

  mutable std::mutex mutex_;
  std::vector<Event> log_;
  std::vector<Listener> listeners_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_AUDIT_LOG_HPP
