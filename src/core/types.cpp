#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace ssebridge {

std::string to_string(ConnectionState state) {
  switch (state) {
    case ConnectionState::Idle:
      return "idle";
    case ConnectionState::Connecting:
      return "connecting";
    case ConnectionState::Connected:
      return "connected";
    case ConnectionState::Closed:
      return "closed";
    case ConnectionState::Failed:
      return "failed";
    case ConnectionState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string to_string(HttpMethod method) {
  switch (method) {
    case HttpMethod::Get:
      return "GET";
    case HttpMethod::Post:
      return "POST";
  }
  return "GET";
}

static char lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (lower(a[i]) != lower(b[i])) return false;
  }
  return true;
}

bool icontains(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char x, char y) {
    return lower(x) == lower(y);
  });
  return it != haystack.end();
}

bool is_blank(std::string_view str) {
  return std::all_of(str.begin(), str.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

}  // namespace ssebridge
