#include "core/version.hpp"

#include <string>

namespace netvisor {

std::string version() {
  return NETVISOR_VERSION_STRING;
}

}  // namespace netvisor
