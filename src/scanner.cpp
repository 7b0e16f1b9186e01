#include "scanner.hpp"
#include <kj/debug.h>

namespace quasar::cypher
{

  static bool is_whitespace(int c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
  static bool is_letter(int c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
  static bool is_digit(int c) { return c >= '0' && c <= '9'; }
  static bool is_ident_char(int c) { return is_letter(c) || is_digit(c) || c == '_'; }

  static Lexeme punct(Token tok, Pos pos)
  {
    return Lexeme{tok, pos, std::string(tokenName(tok))};
  }

  Scanner::Scanner(std::string_view text, Pos origin) : text_(text), pos_(origin) {}

  int Scanner::peek(size_t ahead) const
  {
    if (i_ + ahead >= text_.size())
      return -1;
    return static_cast<unsigned char>(text_[i_ + ahead]);
  }

  int Scanner::read()
  {
    if (i_ >= text_.size())
      return -1;
    int c = static_cast<unsigned char>(text_[i_++]);
    if (c == '\n')
    {
      pos_.line++;
      pos_.column = 1;
    }
    else
    {
      pos_.column++;
    }
    pos_.offset++;
    return c;
  }

  Lexeme Scanner::scan()
  {
    Pos pos = pos_;
    int c = read();
    if (c < 0)
      return Lexeme{Token::Eof, pos, ""};

    if (is_whitespace(c))
      return scanWhitespace(pos);
    if (is_letter(c) || c == '_')
      return scanIdent(pos);
    if (is_digit(c))
      return scanNumber(pos);

    switch (c)
    {
    case '"':
    case '\'':
      return scanQuoted(pos, Token::String);
    case '`':
      return scanQuoted(pos, Token::Ident);
    case '+':
      if (peek() == '=')
      {
        read();
        return punct(Token::Inc, pos);
      }
      return punct(Token::Plus, pos);
    case '-':
      if (peek() == '>')
      {
        read();
        return punct(Token::EdgeRight, pos);
      }
      return punct(Token::Sub, pos);
    case '*':
      return punct(Token::Mul, pos);
    case '%':
      return punct(Token::Mod, pos);
    case '^':
      return punct(Token::Pow, pos);
    case '=':
      return punct(Token::Eq, pos);
    case '|':
      return punct(Token::Bar, pos);
    case '(':
      return punct(Token::LParen, pos);
    case ')':
      return punct(Token::RParen, pos);
    case '{':
      return punct(Token::LBrace, pos);
    case '}':
      return punct(Token::RBrace, pos);
    case '[':
      if (peek() == '*')
        return scanRelRange(pos);
      return punct(Token::LBracket, pos);
    case ']':
      return punct(Token::RBracket, pos);
    case ',':
      return punct(Token::Comma, pos);
    case ':':
      return punct(Token::Colon, pos);
    case ';':
      return punct(Token::Semicolon, pos);
    case '.':
      if (peek() == '.')
      {
        read();
        return punct(Token::DoubleDot, pos);
      }
      return punct(Token::Dot, pos);
    case '<':
      switch (peek())
      {
      case '>':
        read();
        return punct(Token::Neq, pos);
      case '=':
        read();
        return punct(Token::Lte, pos);
      case '-':
        read();
        return punct(Token::EdgeLeft, pos);
      default:
        return punct(Token::Lt, pos);
      }
    case '>':
      if (peek() == '=')
      {
        read();
        return punct(Token::Gte, pos);
      }
      return punct(Token::Gt, pos);
    case '/':
      if (peek() == '/')
        return scanLineComment(pos);
      if (peek() == '*')
        return scanBlockComment(pos);
      return punct(Token::Div, pos);
    default:
      break;
    }
    return Lexeme{Token::Illegal, pos, std::string(1, static_cast<char>(c))};
  }

  Lexeme Scanner::scanWhitespace(Pos pos)
  {
    size_t start = i_ - 1;
    while (is_whitespace(peek()))
      read();
    return Lexeme{Token::Ws, pos, std::string(text_.substr(start, i_ - start))};
  }

  Lexeme Scanner::scanIdent(Pos pos)
  {
    size_t start = i_ - 1;
    while (is_ident_char(peek()))
      read();
    std::string lit(text_.substr(start, i_ - start));
    return Lexeme{lookupKeyword(lit), pos, std::move(lit)};
  }

  // Reads up to the closing quote matching the one already consumed.
  Lexeme Scanner::scanQuoted(Pos pos, Token ok)
  {
    const int quote = static_cast<unsigned char>(text_[i_ - 1]);
    std::string out;
    for (;;)
    {
      Pos at = pos_;
      int c = read();
      if (c == quote)
        return Lexeme{ok, pos, std::move(out)};
      if (c < 0 || c == '\n')
        return Lexeme{Token::BadString, pos, std::move(out)};
      if (c != '\\')
      {
        out.push_back(static_cast<char>(c));
        continue;
      }

      int e = read();
      switch (e)
      {
      case 'n':
        out.push_back('\n');
        break;
      case '\\':
      case '"':
      case '\'':
      case '`':
        out.push_back(static_cast<char>(e));
        break;
      case -1:
        return Lexeme{Token::BadString, pos, std::move(out)};
      default:
        return Lexeme{Token::BadEscape, at, std::string{'\\', static_cast<char>(e)}};
      }
    }
  }

  // A '.' only continues the number when a digit follows it, so "1..3" is
  // INTEGER DOUBLEDOT INTEGER.
  Lexeme Scanner::scanNumber(Pos pos)
  {
    size_t start = i_ - 1;
    while (is_digit(peek()))
      read();

    Token tok = Token::Integer;
    if (peek() == '.' && is_digit(peek(1)))
    {
      tok = Token::Number;
      read();
      while (is_digit(peek()))
        read();
    }
    return Lexeme{tok, pos, std::string(text_.substr(start, i_ - start))};
  }

  Lexeme Scanner::scanRelRange(Pos pos)
  {
    size_t start = i_ - 1;
    for (;;)
    {
      int c = read();
      if (c < 0)
        return Lexeme{Token::Illegal, pos, std::string(text_.substr(start, i_ - start))};
      if (c == ']')
        return Lexeme{Token::RelRange, pos, std::string(text_.substr(start, i_ - start))};
      if (c == '"' || c == '\'' || c == '`')
      {
        // skip quoted text so a ']' inside a property value does not end the range
        for (int q = read(); q != c; q = read())
        {
          if (q < 0)
            return Lexeme{Token::Illegal, pos, std::string(text_.substr(start, i_ - start))};
          if (q == '\\')
            read();
        }
      }
    }
  }

  Lexeme Scanner::scanLineComment(Pos pos)
  {
    size_t start = i_ - 1;
    while (peek() >= 0 && peek() != '\n')
      read();
    return Lexeme{Token::Comment, pos, std::string(text_.substr(start, i_ - start))};
  }

  // Block comments do not nest: the first "*/" closes the comment.
  Lexeme Scanner::scanBlockComment(Pos pos)
  {
    size_t start = i_ - 1;
    read(); // '*'
    for (;;)
    {
      int c = read();
      if (c < 0)
        return Lexeme{Token::Illegal, pos, "/*"};
      if (c == '*' && peek() == '/')
      {
        read();
        return Lexeme{Token::Comment, pos, std::string(text_.substr(start, i_ - start))};
      }
    }
  }

  // -------------------- token buffer --------------------

  TokenBuffer::TokenBuffer(std::string_view text, Pos origin) : s_(text, origin) {}

  const Lexeme &TokenBuffer::scan()
  {
    if (n_ > 0)
    {
      n_--;
      return current();
    }

    i_ = (i_ + 1) % buf_.size();
    do
    {
      buf_[i_] = s_.scan();
    } while (buf_[i_].tok == Token::Ws || buf_[i_].tok == Token::Comment);
    return buf_[i_];
  }

  void TokenBuffer::unscan()
  {
    KJ_REQUIRE(n_ + 1 < buf_.size(), "token buffer cannot step back further");
    n_++;
  }

  const Lexeme &TokenBuffer::current() const
  {
    return buf_[(i_ + buf_.size() - n_) % buf_.size()];
  }

} // namespace quasar::cypher
