#pragma once
#include "token.hpp"
#include <array>
#include <string_view>

namespace quasar::cypher
{

  // Splits query text into positioned lexemes. Scanning never throws: bad
  // input comes back as Illegal, BadString or BadEscape for the parser to report.
  class Scanner
  {
  public:
    explicit Scanner(std::string_view text, Pos origin = {});

    Lexeme scan();

  private:
    int peek(size_t ahead = 0) const;
    int read();

    Lexeme scanWhitespace(Pos pos);
    Lexeme scanIdent(Pos pos);
    Lexeme scanQuoted(Pos pos, Token ok);
    Lexeme scanNumber(Pos pos);
    Lexeme scanRelRange(Pos pos);
    Lexeme scanLineComment(Pos pos);
    Lexeme scanBlockComment(Pos pos);

    std::string_view text_;
    size_t i_{0};
    Pos pos_{};
  };

  // Scanner plus a small ring of already scanned lexemes so the parser can
  // step back. Whitespace and comments are dropped here.
  class TokenBuffer
  {
  public:
    explicit TokenBuffer(std::string_view text, Pos origin = {});

    const Lexeme &scan();
    void unscan();
    const Lexeme &current() const;

  private:
    Scanner s_;
    std::array<Lexeme, 3> buf_{};
    size_t i_{0}; // slot of the newest lexeme
    size_t n_{0}; // lexemes pushed back
  };

} // namespace quasar::cypher
