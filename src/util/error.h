#ifndef LUMINA_UTIL_ERROR_H
#define LUMINA_UTIL_ERROR_H

#include <stdexcept>
#include <string>

namespace Lumina {

// Invalid render configuration, camera or scene. Raised before any work is
// dispatched.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error("configuration error: " + what) {}
};

// Acceleration structure could not be built.
class BuildError : public std::runtime_error {
 public:
  explicit BuildError(const std::string& what)
      : std::runtime_error("build error: " + what) {}
};

// A broken invariant detected while rendering. Thrown inside a worker and
// reported as a failed tile.
class InvalidStateError : public std::runtime_error {
 public:
  explicit InvalidStateError(const std::string& what)
      : std::runtime_error("invalid state: " + what) {}
};

} // namespace Lumina

#endif // LUMINA_UTIL_ERROR_H
