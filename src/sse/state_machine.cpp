#include "sse/state_machine.hpp"

namespace ssebridge {

bool ConnectionStateMachine::is_allowed(ConnectionState from, ConnectionState to) {
  switch (to) {
    case ConnectionState::Idle:
      return false;
    case ConnectionState::Connecting:
      return !ssebridge::is_active(from);
    case ConnectionState::Connected:
      return from == ConnectionState::Connecting;
    case ConnectionState::Closed:
    case ConnectionState::Failed:
    case ConnectionState::Cancelled:
      return ssebridge::is_active(from);
  }
  return false;
}

std::optional<ConnectionStateMachine::AttemptId> ConnectionStateMachine::begin_attempt() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_allowed(state_.load(), ConnectionState::Connecting)) {
    return std::nullopt;
  }
  state_.store(ConnectionState::Connecting);
  return ++attempt_;
}

bool ConnectionStateMachine::transition(AttemptId attempt, ConnectionState to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (attempt != attempt_ || !is_allowed(state_.load(), to)) {
    return false;
  }
  state_.store(to);
  return true;
}

bool ConnectionStateMachine::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ssebridge::is_active(state_.load())) {
    return false;
  }
  state_.store(ConnectionState::Cancelled);
  return true;
}

bool ConnectionStateMachine::is_live(AttemptId attempt) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attempt == attempt_ && ssebridge::is_active(state_.load());
}

}  // namespace ssebridge
