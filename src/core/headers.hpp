#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ssebridge {

using Header = std::pair<std::string, std::string>;

// Ordered HTTP header list. Names compare case-insensitively and may repeat.
class Headers {
 public:
  Headers() = default;

  Headers(std::initializer_list<Header> headers) : entries_(headers) {}

  // Append, keeping any existing values for the same name
  void add(const std::string& name, const std::string& value);

  // Replace every value for `name` with a single one
  void set(const std::string& name, const std::string& value);

  // Returns the number of entries removed
  size_t remove(const std::string& name);

  std::optional<std::string> get(const std::string& name) const;

  std::vector<std::string> values(const std::string& name) const;

  bool contains(const std::string& name) const {
    return get(name).has_value();
  }

  size_t size() const {
    return entries_.size();
  }

  bool empty() const {
    return entries_.empty();
  }

  std::vector<Header>::const_iterator begin() const {
    return entries_.begin();
  }

  std::vector<Header>::const_iterator end() const {
    return entries_.end();
  }

  bool operator==(const Headers& other) const = default;

 private:
  std::vector<Header> entries_;
};

}  // namespace ssebridge
