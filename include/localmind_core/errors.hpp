#pragma once

#include <exception>
#include <initializer_list>
#include <string>

namespace localmind_core {

enum class ErrorKind {
  ContentError,
  EmbeddingUnavailable,
  GenerationUnavailable,
  IndexInconsistency,
  UnknownTool,
  ToolLoopExceeded,
  ToolFailure,
  ToolTimeout,
  Cancelled,
  InvalidArgument,
  StorageError,
  Internal
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ContentError: return "ContentError";
    case ErrorKind::EmbeddingUnavailable: return "EmbeddingUnavailable";
    case ErrorKind::GenerationUnavailable: return "GenerationUnavailable";
    case ErrorKind::IndexInconsistency: return "IndexInconsistency";
    case ErrorKind::UnknownTool: return "UnknownTool";
    case ErrorKind::ToolLoopExceeded: return "ToolLoopExceeded";
    case ErrorKind::ToolFailure: return "ToolFailure";
    case ErrorKind::ToolTimeout: return "ToolTimeout";
    case ErrorKind::Cancelled: return "Cancelled";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    case ErrorKind::StorageError: return "StorageError";
    case ErrorKind::Internal: return "Internal";
  }
  return "Internal";
}

inline ErrorKind error_kind_from_string(const std::string& name) {
  for (ErrorKind kind : {ErrorKind::ContentError, ErrorKind::EmbeddingUnavailable,
                         ErrorKind::GenerationUnavailable, ErrorKind::IndexInconsistency,
                         ErrorKind::UnknownTool, ErrorKind::ToolLoopExceeded, ErrorKind::ToolFailure,
                         ErrorKind::ToolTimeout, ErrorKind::Cancelled, ErrorKind::InvalidArgument,
                         ErrorKind::StorageError}) {
    if (to_string(kind) == name) {
      return kind;
    }
  }
  return ErrorKind::Internal;
}

class LocalMindError : public std::exception {
 public:
  LocalMindError(ErrorKind kind, const std::string& message) : kind_(kind), message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

// The document could not be read, was empty, or is not valid UTF-8.
class ContentError : public LocalMindError {
 public:
  explicit ContentError(const std::string& message)
      : LocalMindError(ErrorKind::ContentError, message) {}
};

class EmbeddingUnavailableError : public LocalMindError {
 public:
  explicit EmbeddingUnavailableError(const std::string& message)
      : LocalMindError(ErrorKind::EmbeddingUnavailable, message) {}
};

class GenerationUnavailableError : public LocalMindError {
 public:
  explicit GenerationUnavailableError(const std::string& message)
      : LocalMindError(ErrorKind::GenerationUnavailable, message) {}
};

// The vector index and the chunk store disagree. Never repaired silently.
class IndexInconsistencyError : public LocalMindError {
 public:
  explicit IndexInconsistencyError(const std::string& message)
      : LocalMindError(ErrorKind::IndexInconsistency, message) {}
};

class UnknownToolError : public LocalMindError {
 public:
  explicit UnknownToolError(const std::string& tool_name)
      : LocalMindError(ErrorKind::UnknownTool, "Unknown tool: " + tool_name) {}
};

class ToolLoopExceededError : public LocalMindError {
 public:
  explicit ToolLoopExceededError(const std::string& message)
      : LocalMindError(ErrorKind::ToolLoopExceeded, message) {}
};

class ToolFailureError : public LocalMindError {
 public:
  explicit ToolFailureError(const std::string& message)
      : LocalMindError(ErrorKind::ToolFailure, message) {}
};

class ToolTimeoutError : public LocalMindError {
 public:
  explicit ToolTimeoutError(const std::string& message)
      : LocalMindError(ErrorKind::ToolTimeout, message) {}
};

class CancelledError : public LocalMindError {
 public:
  explicit CancelledError(const std::string& message)
      : LocalMindError(ErrorKind::Cancelled, message) {}
};

class InvalidArgumentError : public LocalMindError {
 public:
  explicit InvalidArgumentError(const std::string& message)
      : LocalMindError(ErrorKind::InvalidArgument, message) {}
};

class StorageError : public LocalMindError {
 public:
  explicit StorageError(const std::string& message)
      : LocalMindError(ErrorKind::StorageError, message) {}
};

}  // namespace localmind_core
