#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace quasar
{

  enum class ErrorCode : uint8_t
  {
    InvalidInput = 0,
    NotFound = 1,
    AlreadyExists = 2,
    Snapshot = 3
  };

  inline const char *errorCodeName(ErrorCode code)
  {
    switch (code)
    {
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::Snapshot:
      return "Snapshot";
    }
    return "Unknown";
  }

  struct GraphError : std::runtime_error
  {
    GraphError(ErrorCode c, const std::string &what) : std::runtime_error(what), code(c) {}

    ErrorCode code;
  };

  struct InvalidInput : GraphError
  {
    explicit InvalidInput(const std::string &what) : GraphError(ErrorCode::InvalidInput, "invalid input: " + what) {}
  };

  struct NotFound : GraphError
  {
    explicit NotFound(const std::string &what) : GraphError(ErrorCode::NotFound, what) {}
  };

  struct AlreadyExists : GraphError
  {
    explicit AlreadyExists(const std::string &what) : GraphError(ErrorCode::AlreadyExists, what) {}
  };

} // namespace quasar
