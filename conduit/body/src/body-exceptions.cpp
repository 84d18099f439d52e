#include "conduit/body-exceptions.hpp"

#include <cstring>
#include <source_location>

namespace conduit {

const char* BodyAlreadyClaimedException::FileName(const std::source_location& loc) noexcept {
  const char* path = loc.file_name();
  const char* lastSep = std::strrchr(path, '/');
  return lastSep == nullptr ? path : lastSep + 1;
}

}  // namespace conduit
