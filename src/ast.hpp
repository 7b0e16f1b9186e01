#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quasar::cypher
{

  // -------------------- expressions ---------------------------

  struct Variable
  {
    std::string name;
    bool operator==(const Variable &) const = default;
  };

  struct StrLiteral
  {
    std::string value;
    bool operator==(const StrLiteral &) const = default;
  };

  struct IntegerLiteral
  {
    int64_t value{0};
    bool operator==(const IntegerLiteral &) const = default;
  };

  using Expr = std::variant<Variable, StrLiteral, IntegerLiteral>;
  using PropertyMap = std::map<std::string, Expr>;

  // -------------------- patterns ---------------------------

  struct NodePattern
  {
    std::optional<std::string> variable{};
    std::vector<std::string> labels{};
    PropertyMap properties{};
  };

  enum class EdgeDirection : uint8_t
  {
    Right = 0,     // -->
    Left = 1,      // <--
    Undirected = 2 // --
  };

  struct EdgePattern
  {
    EdgeDirection direction{EdgeDirection::Right};
    std::optional<std::string> variable{};
    std::vector<std::string> relTypes{};
    PropertyMap properties{};
    bool varLength{false}; // written with '*'; kept for rendering, the hop window is the same
    std::optional<int64_t> minHops{};
    std::optional<int64_t> maxHops{}; // unset or -1 = unbounded
  };

  using PatternElement = std::variant<NodePattern, EdgePattern>;

  struct MatchPattern
  {
    std::optional<std::string> variable{};
    std::vector<PatternElement> elements{};
  };

  // -------------------- clauses ---------------------------

  struct ReadingClause
  {
    bool optional{false};
    std::vector<MatchPattern> patterns{};
    std::optional<Expr> where{};
  };

  enum class SortDirection : uint8_t
  {
    Ascending = 0,
    Descending = 1
  };

  struct OrderBy
  {
    Expr item{};
    SortDirection direction{SortDirection::Ascending};
  };

  struct SingleQuery
  {
    std::vector<ReadingClause> reading{};
    bool distinct{false};
    std::vector<Expr> returnItems{};
    std::vector<OrderBy> order{};
    std::optional<Expr> skip{};
    std::optional<Expr> limit{};
  };

  struct Query
  {
    SingleQuery root{};
  };

  template <class... Ts>
  struct overloaded : Ts...
  {
    using Ts::operator()...;
  };

  // -------------------- rendering ---------------------------

  // Query text that parses back to an equivalent tree.
  std::string toString(const Expr &e);
  std::string toString(const NodePattern &n);
  std::string toString(const EdgePattern &e);
  std::string toString(const MatchPattern &p);
  std::string toString(const ReadingClause &rc);
  std::string toString(const SingleQuery &q);
  std::string toString(const Query &q);

} // namespace quasar::cypher
