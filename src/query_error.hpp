#pragma once
#include "token.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace quasar::cypher
{

  struct QueryError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // Raised on the first bad token; there is no recovery.
  struct ParseError : QueryError
  {
    ParseError(const std::string &message, std::string found, std::vector<std::string> expected, Pos pos);

    std::string found;
    std::vector<std::string> expected;
    Pos pos;
  };

  // unterminated string, bad escape, stray character
  struct LexicalError : ParseError
  {
    using ParseError::ParseError;
  };

  // unexpected token
  struct SyntaxError : ParseError
  {
    using ParseError::ParseError;
  };

  // the tree parsed but cannot be executed in its shape
  struct StructuralQueryError : QueryError
  {
    using QueryError::QueryError;
  };

  struct ExecutionError : QueryError
  {
    using QueryError::QueryError;
  };

} // namespace quasar::cypher
