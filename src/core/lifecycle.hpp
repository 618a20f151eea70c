#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace ssebridge {

// Teardown signal owned by the embedding application.
//
// Clients bound to a Lifecycle disconnect and release their resources when destroy() is
// called (or the Lifecycle itself is destroyed), and never dispatch another callback afterwards.
class Lifecycle {
 public:
  using ObserverId = uint64_t;

  Lifecycle() = default;

  // Dropping the lifecycle destroys it
  ~Lifecycle();

  Lifecycle(const Lifecycle&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;

  // Register a destroy observer. If already destroyed, `observer` runs immediately.
  ObserverId add_observer(std::function<void()> observer);

  void remove_observer(ObserverId id);

  // Marks the lifecycle destroyed, then notifies observers outside the lock. Idempotent.
  void destroy();

  bool is_destroyed() const {
    return destroyed_.load();
  }

 private:
  std::mutex mutex_;
  std::atomic<bool> destroyed_{false};
  ObserverId next_id_ = 1;
  std::map<ObserverId, std::function<void()>> observers_;
};

}  // namespace ssebridge
