#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

#include "core/types.hpp"

namespace ssebridge {

// Single authoritative connection state of one client.
//
// Reads are lock-free. Transitions are serialised and tagged with the attempt that produced
// them, so a late callback from an earlier attempt can never move the current state.
//
//   Idle|Closed|Failed|Cancelled --begin_attempt--> Connecting --> Connected
//   Connecting|Connected --> Closed|Failed|Cancelled
class ConnectionStateMachine {
 public:
  using AttemptId = uint64_t;

  ConnectionState state() const {
    return state_.load();
  }

  bool is_active() const {
    return ssebridge::is_active(state_.load());
  }

  // Moves to Connecting and returns the new attempt id; nullopt while an attempt is active
  std::optional<AttemptId> begin_attempt();

  // Applies `to` if `attempt` is current and the move is allowed
  bool transition(AttemptId attempt, ConnectionState to);

  // Cancels the current attempt if it is active. Returns false when nothing was active.
  bool cancel();

  // True while `attempt` is current and not terminal
  bool is_live(AttemptId attempt) const;

  static bool is_allowed(ConnectionState from, ConnectionState to);

 private:
  mutable std::mutex mutex_;
  std::atomic<ConnectionState> state_{ConnectionState::Idle};
  AttemptId attempt_ = 0;
};

}  // namespace ssebridge
