#pragma once
#ifndef MERKLECLAIM_PAUSE_SWITCH_H
#define MERKLECLAIM_PAUSE_SWITCH_H

#include <atomic>

namespace merkleclaim {

/**
 * @brief Operational mode consulted before every claim.
 *
 * Permission checks for pause()/unpause() live in AdminSurface.
 */
class PauseSwitch {
public:
  explicit PauseSwitch(bool paused = false) : paused_(paused) {}

  bool isAcceptingClaims() const { return !paused_.load(); }
  bool isPaused() const { return paused_.load(); }

  void pause() { paused_.store(true); }
  void unpause() { paused_.store(false); }

private:
  std::atomic<bool> paused_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_PAUSE_SWITCH_H
