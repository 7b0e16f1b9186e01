#include "parser.hpp"
#include <charconv>

namespace quasar::cypher
{

  static std::string format_parse_error(const std::string &message, const std::string &found,
                                        const std::vector<std::string> &expected, Pos pos)
  {
    std::string out;
    if (!message.empty())
    {
      out = message;
    }
    else
    {
      out = "found " + found + ", expected ";
      for (size_t i = 0; i < expected.size(); ++i)
      {
        if (i > 0)
          out += ", ";
        out += expected[i];
      }
    }
    out += " at line " + std::to_string(pos.line) + ", column " + std::to_string(pos.column);
    return out;
  }

  ParseError::ParseError(const std::string &message, std::string found_, std::vector<std::string> expected_, Pos pos_)
      : QueryError(format_parse_error(message, found_, expected_, pos_)),
        found(std::move(found_)), expected(std::move(expected_)), pos(pos_)
  {
  }

  Parser::Parser(std::string_view text, Pos origin) : buf_(text, origin) {}

  // -------------------- token access --------------------

  Lexeme Parser::scan()
  {
    Lexeme lx = buf_.scan();
    switch (lx.tok)
    {
    case Token::Illegal:
      throw LexicalError("illegal token " + lx.lit, lx.lit, {}, lx.pos);
    case Token::BadString:
      throw LexicalError("unterminated string", lx.lit, {}, lx.pos);
    case Token::BadEscape:
      throw LexicalError("invalid escape sequence " + lx.lit, lx.lit, {}, lx.pos);
    default:
      return lx;
    }
  }

  void Parser::unscan()
  {
    buf_.unscan();
  }

  void Parser::fail(const Lexeme &found, std::vector<std::string> expected)
  {
    throw SyntaxError("", describe(found), std::move(expected), found.pos);
  }

  int64_t Parser::parseInteger(const Lexeme &lx)
  {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(lx.lit.data(), lx.lit.data() + lx.lit.size(), v);
    if (ec != std::errc() || ptr != lx.lit.data() + lx.lit.size())
      throw SyntaxError("integer literal out of range: " + lx.lit, lx.lit, {}, lx.pos);
    return v;
  }

  // -------------------- statements --------------------

  Query Parser::parseQuery()
  {
    Query q{};
    bool parsed = false;
    for (;;)
    {
      Lexeme lx = scan();
      if (lx.tok == Token::Semicolon)
        continue;
      if (lx.tok == Token::Eof)
      {
        if (!parsed)
          fail(lx, {"MATCH", "OPTIONAL"});
        return q;
      }
      if (parsed)
        fail(lx, {";", "EOF"});

      unscan();
      q.root = parseSingleQuery();
      parsed = true;
    }
  }

  SingleQuery Parser::parseSingleQuery()
  {
    SingleQuery sq{};

    for (;;)
    {
      Lexeme lx = scan();
      unscan();
      if (lx.tok != Token::Match && lx.tok != Token::Optional)
        break;
      sq.reading.push_back(parseReadingClause());
    }

    Lexeme lx = scan();
    if (sq.reading.empty())
      fail(lx, {"MATCH", "OPTIONAL"});
    if (lx.tok != Token::Return)
      fail(lx, {"MATCH", "OPTIONAL", "RETURN"});

    lx = scan();
    if (lx.tok == Token::Distinct)
      sq.distinct = true;
    else
      unscan();

    for (;;)
    {
      sq.returnItems.push_back(parseExpr());
      if (scan().tok != Token::Comma)
      {
        unscan();
        break;
      }
    }

    lx = scan();
    if (lx.tok == Token::Order)
    {
      lx = scan();
      if (lx.tok != Token::By)
        fail(lx, {"BY"});
      for (;;)
      {
        OrderBy ob{};
        ob.item = parseExpr();
        lx = scan();
        if (lx.tok == Token::Desc || lx.tok == Token::Descending)
          ob.direction = SortDirection::Descending;
        else if (lx.tok != Token::Asc && lx.tok != Token::Ascending)
          unscan();
        sq.order.push_back(std::move(ob));

        if (scan().tok != Token::Comma)
        {
          unscan();
          break;
        }
      }
    }
    else
    {
      unscan();
    }

    if (scan().tok == Token::Skip)
      sq.skip = parseExpr();
    else
      unscan();

    if (scan().tok == Token::Limit)
      sq.limit = parseExpr();
    else
      unscan();

    return sq;
  }

  ReadingClause Parser::parseReadingClause()
  {
    ReadingClause rc{};

    Lexeme lx = scan();
    if (lx.tok == Token::Optional)
    {
      rc.optional = true;
      lx = scan();
    }
    if (lx.tok != Token::Match)
      fail(lx, {"MATCH"});

    for (;;)
    {
      rc.patterns.push_back(parseMatchPattern());
      if (scan().tok != Token::Comma)
      {
        unscan();
        break;
      }
    }

    if (scan().tok == Token::Where)
      rc.where = parseExpr();
    else
      unscan();

    return rc;
  }

  // -------------------- patterns --------------------

  MatchPattern Parser::parseMatchPattern()
  {
    MatchPattern mp{};

    Lexeme lx = scan();
    if (lx.tok == Token::Ident)
    {
      Lexeme eq = scan();
      if (eq.tok != Token::Eq)
        fail(eq, {"="});
      mp.variable = lx.lit;
    }
    else
    {
      unscan();
    }

    mp.elements.emplace_back(parseNodePattern());
    for (;;)
    {
      auto edge = parseEdgePattern();
      if (!edge)
        break;
      mp.elements.emplace_back(std::move(*edge));
      mp.elements.emplace_back(parseNodePattern());
    }
    return mp;
  }

  NodePattern Parser::parseNodePattern()
  {
    NodePattern node{};

    Lexeme lx = scan();
    if (lx.tok != Token::LParen)
      fail(lx, {"("});

    lx = scan();
    if (lx.tok == Token::Ident)
      node.variable = lx.lit;
    else
      unscan();

    for (;;)
    {
      if (scan().tok != Token::Colon)
      {
        unscan();
        break;
      }
      lx = scan();
      if (lx.tok != Token::Ident)
        fail(lx, {"label"});
      node.labels.push_back(lx.lit);
    }

    bool hasProps = false;
    if (scan().tok == Token::LBrace)
    {
      node.properties = parseProperties();
      hasProps = true;
    }
    else
    {
      unscan();
    }

    lx = scan();
    if (lx.tok != Token::RParen)
    {
      if (hasProps)
        fail(lx, {")"});
      fail(lx, {":", "{", ")"});
    }
    return node;
  }

  std::optional<EdgePattern> Parser::parseEdgePattern()
  {
    Lexeme lx = scan();
    bool left = false;
    if (lx.tok == Token::EdgeLeft)
      left = true;
    else if (lx.tok != Token::Sub)
    {
      unscan();
      return std::nullopt;
    }

    EdgePattern ep{};
    bool bracketed = true;
    lx = scan();
    if (lx.tok == Token::LBracket)
    {
      parseEdgeBody(ep);
    }
    else if (lx.tok == Token::RelRange)
    {
      // re-parse the "[*...]" text from just past the '['
      Pos origin = lx.pos;
      origin.column++;
      origin.offset++;
      Parser sub(std::string_view(lx.lit).substr(1), origin);
      sub.parseEdgeBody(ep);
      Lexeme rest = sub.scan();
      if (rest.tok != Token::Eof)
        sub.fail(rest, {"-", "->"});
    }
    else
    {
      bracketed = false;
      unscan();
    }

    lx = scan();
    bool right = false;
    if (lx.tok == Token::EdgeRight)
      right = true;
    else if (lx.tok != Token::Sub)
    {
      if (bracketed)
        fail(lx, {"-", "->"});
      fail(lx, {"[", "-", "->"});
    }

    if (left && !right)
      ep.direction = EdgeDirection::Left;
    else if (right && !left)
      ep.direction = EdgeDirection::Right;
    else
      ep.direction = EdgeDirection::Undirected;
    return ep;
  }

  // Everything after '[' up to and including ']'.
  void Parser::parseEdgeBody(EdgePattern &ep)
  {
    Lexeme lx = scan();
    if (lx.tok == Token::Ident)
      ep.variable = lx.lit;
    else
      unscan();

    if (scan().tok == Token::Colon)
    {
      for (;;)
      {
        lx = scan();
        if (lx.tok == Token::Colon)
          lx = scan();
        if (lx.tok != Token::Ident)
          fail(lx, {"relationship type"});
        ep.relTypes.push_back(lx.lit);
        if (scan().tok != Token::Bar)
        {
          unscan();
          break;
        }
      }
    }
    else
    {
      unscan();
    }

    lx = scan();
    if (lx.tok == Token::Mul)
      parseHops(ep, lx);
    else
      unscan();

    if (scan().tok == Token::LBrace)
      ep.properties = parseProperties();
    else
      unscan();

    lx = scan();
    if (lx.tok != Token::RBracket)
      fail(lx, {"]"});
  }

  // '*' INT? ('..' INT?)?  A lone INT fixes the hop count.
  void Parser::parseHops(EdgePattern &ep, const Lexeme &star)
  {
    ep.varLength = true;

    Lexeme lx = scan();
    if (lx.tok == Token::Integer)
    {
      ep.minHops = parseInteger(lx);
      if (scan().tok == Token::DoubleDot)
      {
        lx = scan();
        if (lx.tok == Token::Integer)
          ep.maxHops = parseInteger(lx);
        else
          unscan();
      }
      else
      {
        unscan();
        ep.maxHops = ep.minHops;
      }
    }
    else if (lx.tok == Token::DoubleDot)
    {
      lx = scan();
      if (lx.tok == Token::Integer)
        ep.maxHops = parseInteger(lx);
      else
        unscan();
    }
    else
    {
      unscan();
    }

    if (ep.minHops && ep.maxHops && *ep.minHops > *ep.maxHops)
      throw SyntaxError("minimum hop count " + std::to_string(*ep.minHops) + " exceeds maximum " + std::to_string(*ep.maxHops),
                        describe(star), {}, star.pos);
  }

  PropertyMap Parser::parseProperties()
  {
    PropertyMap props;

    Lexeme lx = scan();
    if (lx.tok == Token::RBrace)
      return props;
    unscan();

    for (;;)
    {
      Lexeme key = scan();
      if (key.tok != Token::Ident)
        fail(key, {"identifier"});
      lx = scan();
      if (lx.tok != Token::Colon)
        fail(lx, {":"});
      if (!props.emplace(key.lit, parseExpr()).second)
        throw SyntaxError("duplicate property key " + key.lit, key.lit, {}, key.pos);

      lx = scan();
      if (lx.tok == Token::RBrace)
        return props;
      if (lx.tok != Token::Comma)
        fail(lx, {",", "}"});
    }
  }

  Expr Parser::parseExpr()
  {
    Lexeme lx = scan();
    switch (lx.tok)
    {
    case Token::Ident:
      return Variable{lx.lit};
    case Token::String:
      return StrLiteral{lx.lit};
    case Token::Integer:
      return IntegerLiteral{parseInteger(lx)};
    default:
      fail(lx, {"identifier", "string", "integer"});
    }
  }

  Query parseQuery(std::string_view text)
  {
    return Parser(text).parseQuery();
  }

} // namespace quasar::cypher
