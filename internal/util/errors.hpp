#pragma once

#include <stdexcept>
#include <string>

namespace pricing::util {

/*
  Central error types.

  Only the entity write path throws these to callers. Pricing and
  invalidation degrade instead of throwing.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by a CacheStore when the backing store cannot serve a request.
// KeyedCache converts it into a miss / failed write.
class CacheBackendError : public std::runtime_error {
 public:
  explicit CacheBackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pricing::util
