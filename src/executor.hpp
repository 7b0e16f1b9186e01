#pragma once
#include "ast.hpp"
#include "query_error.hpp"
#include "store.hpp"
#include <map>
#include <string_view>

namespace quasar::cypher
{

  // variable name -> bound node
  using Row = std::map<std::string, Node>;

  // Runs a single linear MATCH chain against the store and returns the
  // projected rows. Throws StructuralQueryError when the tree has a shape the
  // executor cannot run and ExecutionError for unsupported expressions; no
  // rows are returned on error.
  std::vector<Row> executeQuery(const Query &query, const Store &store);

  // parseQuery followed by executeQuery
  std::vector<Row> executeQuery(std::string_view text, const Store &store);

  // Equality between a pattern literal and a stored property value.
  bool literalMatches(const Expr &literal, const Value &stored);

  bool nodeMatches(const Node &node, const NodePattern &pattern);

} // namespace quasar::cypher
