#include "core/headers.hpp"

#include <algorithm>

#include "core/types.hpp"

namespace ssebridge {

void Headers::add(const std::string& name, const std::string& value) {
  entries_.emplace_back(name, value);
}

void Headers::set(const std::string& name, const std::string& value) {
  remove(name);
  entries_.emplace_back(name, value);
}

size_t Headers::remove(const std::string& name) {
  auto before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&name](const Header& h) {
                                  return iequals(h.first, name);
                                }),
                 entries_.end());
  return before - entries_.size();
}

std::optional<std::string> Headers::get(const std::string& name) const {
  for (const auto& [key, value] : entries_) {
    if (iequals(key, name)) return value;
  }
  return std::nullopt;
}

std::vector<std::string> Headers::values(const std::string& name) const {
  std::vector<std::string> result;
  for (const auto& [key, value] : entries_) {
    if (iequals(key, name)) result.push_back(value);
  }
  return result;
}

}  // namespace ssebridge
