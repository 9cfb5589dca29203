#pragma once

#include <exception>
#include <string>

namespace finmda_core {

class FinmdaError : public std::exception {
 public:
  explicit FinmdaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Caller-supplied parameters contradict each other. Never retried.
class InvalidConfig : public FinmdaError {
 public:
  explicit InvalidConfig(const std::string &message) : FinmdaError(message) {}
};

// The embedding backend failed or did not answer within the timeout.
class EmbeddingUnavailable : public FinmdaError {
 public:
  explicit EmbeddingUnavailable(const std::string &message) : FinmdaError(message) {}
};

// The vector store could not be reached or rejected the operation.
class IndexUnavailable : public FinmdaError {
 public:
  explicit IndexUnavailable(const std::string &message) : FinmdaError(message) {}
};

class DataLoadError : public FinmdaError {
 public:
  explicit DataLoadError(const std::string &message) : FinmdaError(message) {}
};

}  // namespace finmda_core
