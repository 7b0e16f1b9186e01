#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace quasar::cypher
{

  enum class Token : uint8_t
  {
    // special
    Illegal = 0,
    Eof,
    Ws,
    Comment,

    // literals
    Ident,
    Number,
    Integer,
    String,
    BadString,
    BadEscape,
    True,
    False,
    Null,

    // operators
    Plus,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    Eq,
    Neq,
    Lt,
    Lte,
    Gt,
    Gte,
    Inc,
    Bar,
    And,
    Or,
    Xor,
    Not,

    // punctuation
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Comma,
    Colon,
    Semicolon,
    Dot,
    DoubleDot,
    EdgeRight,
    EdgeLeft,
    RelRange,

    // keywords
    Add,
    All,
    As,
    Asc,
    Ascending,
    By,
    Case,
    Constraint,
    Contains,
    Create,
    Delete,
    Desc,
    Descending,
    Detach,
    Distinct,
    Do,
    Drop,
    Else,
    End,
    Ends,
    Exists,
    For,
    In,
    Is,
    Limit,
    Mandatory,
    Match,
    Merge,
    Of,
    On,
    Optional,
    Order,
    Remove,
    Require,
    Return,
    Scalar,
    Set,
    Skip,
    Starts,
    Then,
    Union,
    Unique,
    Unwind,
    When,
    Where,
    With
  };

  // line and column are 1-based, offset is the 0-based byte offset
  struct Pos
  {
    int line{1};
    int column{1};
    size_t offset{0};

    bool operator==(const Pos &) const = default;
  };

  struct Lexeme
  {
    Token tok{Token::Illegal};
    Pos pos{};
    std::string lit{};
  };

  std::string_view tokenName(Token tok);

  bool isKeyword(Token tok);
  bool isOperator(Token tok);

  // Case-insensitive keyword lookup; Token::Ident when the word is not reserved.
  Token lookupKeyword(std::string_view word);

  // the literal when there is one, the token's name otherwise
  std::string describe(const Lexeme &lx);

} // namespace quasar::cypher
