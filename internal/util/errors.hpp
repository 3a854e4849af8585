#pragma once

#include <stdexcept>
#include <string>

namespace carelog::util {

/*
  Exception types thrown below the stage boundary (stores, repositories,
  blob storage). Stages catch them and convert with util::ToStatus().
*/

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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable write/read failure (disk, sqlite). Never transient.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace carelog::util
