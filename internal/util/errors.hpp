#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace phrase::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Carries every violation found, not only the first.
class ValidationFailed : public std::runtime_error {
 public:
  explicit ValidationFailed(std::vector<std::string> errors) : std::runtime_error(Join(errors)), errors_(std::move(errors)) {
  }

  const std::vector<std::string>& Errors() const {
    return errors_;
  }

 private:
  static std::string Join(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
      if (!out.empty()) out += "; ";
      out += e;
    }
    return out;
  }

  std::vector<std::string> errors_;
};

// The request is well formed but the stored state does not allow it yet.
class FailedPrecondition : public std::runtime_error {
 public:
  explicit FailedPrecondition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic write-write conflict between concurrent transactions.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  StorageError(const std::string& msg, bool transient) : std::runtime_error(msg), transient_(transient) {
  }

  bool Transient() const {
    return transient_;
  }

 private:
  bool transient_;
};

} // namespace phrase::util
