#include "ast.hpp"
#include "token.hpp"

namespace quasar::cypher
{

  static bool is_plain_ident(const std::string &s)
  {
    if (s.empty())
      return false;
    auto ok_first = [](char c)
    { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    auto ok_rest = [&](char c)
    { return ok_first(c) || (c >= '0' && c <= '9'); };
    if (!ok_first(s[0]))
      return false;
    for (char c : s)
      if (!ok_rest(c))
        return false;
    return lookupKeyword(s) == Token::Ident;
  }

  static std::string quote(const std::string &s, char q)
  {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back(q);
    for (char c : s)
    {
      if (c == '\n')
      {
        out += "\\n";
        continue;
      }
      if (c == q || c == '\\')
        out.push_back('\\');
      out.push_back(c);
    }
    out.push_back(q);
    return out;
  }

  static std::string ident(const std::string &s)
  {
    return is_plain_ident(s) ? s : quote(s, '`');
  }

  static std::string props(const PropertyMap &m)
  {
    std::string out = "{";
    bool first = true;
    for (const auto &[k, v] : m)
    {
      if (!first)
        out += ", ";
      first = false;
      out += ident(k);
      out += ": ";
      out += toString(v);
    }
    out += "}";
    return out;
  }

  std::string toString(const Expr &e)
  {
    return std::visit(overloaded{
                          [](const Variable &v)
                          { return ident(v.name); },
                          [](const StrLiteral &s)
                          { return quote(s.value, '\''); },
                          [](const IntegerLiteral &i)
                          { return std::to_string(i.value); },
                      },
                      e);
  }

  std::string toString(const NodePattern &n)
  {
    std::string out = "(";
    if (n.variable)
      out += ident(*n.variable);
    for (const auto &l : n.labels)
      out += ":" + ident(l);
    if (!n.properties.empty())
    {
      if (out.size() > 1)
        out += " ";
      out += props(n.properties);
    }
    out += ")";
    return out;
  }

  static std::string hops(const EdgePattern &e)
  {
    if (!e.varLength)
      return "";
    std::string out = "*";
    bool bounded = e.maxHops && *e.maxHops >= 0;
    if (e.minHops && bounded && *e.minHops == *e.maxHops)
      return out + std::to_string(*e.minHops);
    if (e.minHops)
      out += std::to_string(*e.minHops);
    if (bounded)
      out += ".." + std::to_string(*e.maxHops);
    else if (e.minHops)
      out += "..";
    return out;
  }

  std::string toString(const EdgePattern &e)
  {
    std::string body;
    if (e.variable)
      body += ident(*e.variable);
    for (size_t i = 0; i < e.relTypes.size(); ++i)
      body += (i == 0 ? ":" : "|") + ident(e.relTypes[i]);
    body += hops(e);
    if (!e.properties.empty())
    {
      if (!body.empty())
        body += " ";
      body += props(e.properties);
    }

    std::string out = e.direction == EdgeDirection::Left ? "<-" : "-";
    if (!body.empty())
      out += "[" + body + "]";
    out += e.direction == EdgeDirection::Right ? "->" : "-";
    return out;
  }

  std::string toString(const MatchPattern &p)
  {
    std::string out;
    if (p.variable)
      out += ident(*p.variable) + " = ";
    for (const auto &el : p.elements)
      out += std::visit([](const auto &x)
                        { return toString(x); },
                        el);
    return out;
  }

  std::string toString(const ReadingClause &rc)
  {
    std::string out = rc.optional ? "OPTIONAL MATCH " : "MATCH ";
    for (size_t i = 0; i < rc.patterns.size(); ++i)
    {
      if (i > 0)
        out += ", ";
      out += toString(rc.patterns[i]);
    }
    if (rc.where)
      out += " WHERE " + toString(*rc.where);
    return out;
  }

  std::string toString(const SingleQuery &q)
  {
    std::string out;
    for (const auto &rc : q.reading)
      out += toString(rc) + " ";
    out += "RETURN ";
    if (q.distinct)
      out += "DISTINCT ";
    for (size_t i = 0; i < q.returnItems.size(); ++i)
    {
      if (i > 0)
        out += ", ";
      out += toString(q.returnItems[i]);
    }
    for (size_t i = 0; i < q.order.size(); ++i)
    {
      out += i == 0 ? " ORDER BY " : ", ";
      out += toString(q.order[i].item);
      if (q.order[i].direction == SortDirection::Descending)
        out += " DESC";
    }
    if (q.skip)
      out += " SKIP " + toString(*q.skip);
    if (q.limit)
      out += " LIMIT " + toString(*q.limit);
    return out;
  }

  std::string toString(const Query &q)
  {
    return toString(q.root) + ";";
  }

} // namespace quasar::cypher
