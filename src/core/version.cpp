#include "core/version.hpp"

#include <string>

namespace ssebridge {

std::string version() {
  return SSEBRIDGE_VERSION_STRING;
}

}  // namespace ssebridge
