#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace entitystore::util {

/*
  Central error types.

  Backends report db::Result codes; stores translate them into these.
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

// Store opened with migrations disallowed over data written by an older version.
class MigrationRequired : public std::runtime_error {
 public:
  explicit MigrationRequired(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persisted data was written by a newer version than this binary.
class ServerOutdated : public std::runtime_error {
 public:
  explicit ServerOutdated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A single document has no registered upgrade path. Fatal for the document only.
class UnmigratableDocument : public std::runtime_error {
 public:
  UnmigratableDocument(const std::string& msg, std::string version) : std::runtime_error(msg), version_(std::move(version)) {
  }

  const std::string& version() const {
    return version_;
  }

 private:
  std::string version_;
};

// Stored payload failed to deserialize.
class InvalidContent : public std::runtime_error {
 public:
  explicit InvalidContent(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BackendError : public std::runtime_error {
 public:
  explicit BackendError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace entitystore::util
