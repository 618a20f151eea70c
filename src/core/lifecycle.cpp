#include "core/lifecycle.hpp"

#include <vector>

namespace ssebridge {

Lifecycle::~Lifecycle() {
  destroy();
}

Lifecycle::ObserverId Lifecycle::add_observer(std::function<void()> observer) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!destroyed_) {
      auto id = next_id_++;
      observers_.emplace(id, std::move(observer));
      return id;
    }
  }
  observer();
  return 0;
}

void Lifecycle::remove_observer(ObserverId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  observers_.erase(id);
}

void Lifecycle::destroy() {
  std::vector<std::function<void()>> to_call;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_.exchange(true)) return;
    for (auto& [id, observer] : observers_) {
      to_call.push_back(std::move(observer));
    }
    observers_.clear();
  }

  for (const auto& observer : to_call) {
    observer();
  }
}

}  // namespace ssebridge
