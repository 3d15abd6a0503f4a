#pragma once

#include <stdexcept>
#include <string>

namespace artifact::util {

/*
  Central error types.

  Every failure in the store is reported to the caller through one of these.
  Transformer failures are whatever the transformer throws; TransformerError
  is offered for transformers that want a common type.
*/

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Hash collision with differing bytes, a payload that fails hash
// verification, or a record whose parent is not indexed.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateError : public std::runtime_error {
 public:
  explicit DuplicateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Snapshot / database read or write failure.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransformerError : public std::runtime_error {
 public:
  explicit TransformerError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace artifact::util
