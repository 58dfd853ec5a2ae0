#pragma once

#include <exception>
#include <string>

namespace ragdesk_core {

enum class ErrorKind { InvalidInput, Ingestion, StoreLoad, ModelMismatch, Upstream, Timeout };

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInput:
      return "InvalidInput";
    case ErrorKind::Ingestion:
      return "Ingestion";
    case ErrorKind::StoreLoad:
      return "StoreLoad";
    case ErrorKind::ModelMismatch:
      return "ModelMismatch";
    case ErrorKind::Upstream:
      return "Upstream";
    case ErrorKind::Timeout:
      return "Timeout";
    default:
      return "Unknown";
  }
}

// Base for every failure the pipeline reports. The kind lets the serving layer
// tell client mistakes apart from server and upstream faults.
class RagError : public std::exception {
 public:
  RagError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

class InvalidInputError : public RagError {
 public:
  explicit InvalidInputError(const std::string &message)
      : RagError(ErrorKind::InvalidInput, message) {}
};

class IngestionError : public RagError {
 public:
  explicit IngestionError(const std::string &message) : RagError(ErrorKind::Ingestion, message) {}
};

class StoreLoadError : public RagError {
 public:
  explicit StoreLoadError(const std::string &message) : RagError(ErrorKind::StoreLoad, message) {}
};

class ModelMismatchError : public RagError {
 public:
  explicit ModelMismatchError(const std::string &message)
      : RagError(ErrorKind::ModelMismatch, message) {}
};

class UpstreamError : public RagError {
 public:
  explicit UpstreamError(const std::string &message) : RagError(ErrorKind::Upstream, message) {}
};

class TimeoutError : public RagError {
 public:
  explicit TimeoutError(const std::string &message) : RagError(ErrorKind::Timeout, message) {}
};

}  // namespace ragdesk_core
