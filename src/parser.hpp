#pragma once
#include "ast.hpp"
#include "query_error.hpp"
#include "scanner.hpp"
#include <optional>
#include <string_view>

namespace quasar::cypher
{

  // Recursive descent over a TokenBuffer with one token of pushback.
  class Parser
  {
  public:
    explicit Parser(std::string_view text, Pos origin = {});

    Query parseQuery();
    SingleQuery parseSingleQuery();
    ReadingClause parseReadingClause();
    MatchPattern parseMatchPattern();
    NodePattern parseNodePattern();
    std::optional<EdgePattern> parseEdgePattern();
    Expr parseExpr();

  private:
    Lexeme scan();
    void unscan();
    [[noreturn]] void fail(const Lexeme &found, std::vector<std::string> expected);

    PropertyMap parseProperties();
    void parseEdgeBody(EdgePattern &ep);
    void parseHops(EdgePattern &ep, const Lexeme &star);
    int64_t parseInteger(const Lexeme &lx);

    TokenBuffer buf_;
  };

  // Parses a single statement, optionally terminated by ';'.
  Query parseQuery(std::string_view text);

} // namespace quasar::cypher
