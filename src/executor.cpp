#include "executor.hpp"
#include "parser.hpp"
#include "traverse.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <set>

namespace quasar::cypher
{

  namespace
  {

    // One hop window of the chain: an edge pattern and the node pattern it leads to.
    struct Segment
    {
      const NodePattern *target;
      Direction direction;
      int64_t minHops;
      int64_t maxHops; // -1 = unbounded
    };

    struct Binding
    {
      Row row;
      std::string start;
      Node end;
    };

    std::optional<std::string> value_text(const Value &v)
    {
      return std::visit(overloaded{
                            [](int64_t x) -> std::optional<std::string>
                            { return std::to_string(x); },
                            [](uint64_t x) -> std::optional<std::string>
                            { return std::to_string(x); },
                            [](double x) -> std::optional<std::string>
                            {
                              char buf[64];
                              auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), x);
                              if (ec != std::errc())
                                return std::nullopt;
                              return std::string(buf, ptr);
                            },
                            [](bool x) -> std::optional<std::string>
                            { return std::string(x ? "true" : "false"); },
                            [](const std::string &x) -> std::optional<std::string>
                            { return x; },
                            [](std::monostate) -> std::optional<std::string>
                            { return std::nullopt; },
                        },
                        v);
    }

    // stored value tried as integer, unsigned, truncated float, then string
    bool integer_equals(const Value &v, int64_t want)
    {
      if (const auto *i = std::get_if<int64_t>(&v))
        return *i == want;
      if (const auto *u = std::get_if<uint64_t>(&v))
        return want >= 0 && *u == static_cast<uint64_t>(want);
      if (const auto *d = std::get_if<double>(&v))
      {
        if (!std::isfinite(*d))
          return false;
        double t = std::trunc(*d);
        if (t < -9223372036854775808.0 || t >= 9223372036854775808.0)
          return false;
        return static_cast<int64_t>(t) == want;
      }
      if (const auto *s = std::get_if<std::string>(&v))
      {
        int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        return ec == std::errc() && ptr == s->data() + s->size() && parsed == want;
      }
      return false;
    }

    Direction to_direction(EdgeDirection d)
    {
      switch (d)
      {
      case EdgeDirection::Right:
        return Direction::Out;
      case EdgeDirection::Left:
        return Direction::In;
      case EdgeDirection::Undirected:
        return Direction::Both;
      }
      return Direction::Out;
    }

    const NodePattern &node_at(const MatchPattern &mp, size_t i)
    {
      const auto *n = std::get_if<NodePattern>(&mp.elements[i]);
      if (n == nullptr)
        throw StructuralQueryError("pattern element " + std::to_string(i) + " must be a node pattern");
      return *n;
    }

    const EdgePattern &edge_at(const MatchPattern &mp, size_t i)
    {
      const auto *e = std::get_if<EdgePattern>(&mp.elements[i]);
      if (e == nullptr)
        throw StructuralQueryError("pattern element " + std::to_string(i) + " must be an edge pattern");
      return *e;
    }

    void check_property_exprs(const PropertyMap &props)
    {
      for (const auto &[key, e] : props)
        if (std::holds_alternative<Variable>(e))
          throw ExecutionError("property " + key + ": variable references are not supported in pattern properties");
    }

    // Validates the single-chain shape the executor supports.
    const MatchPattern &check_shape(const SingleQuery &q)
    {
      if (q.reading.empty())
        throw StructuralQueryError("query has no MATCH clause");
      if (q.reading.size() > 1)
        throw StructuralQueryError("only one MATCH clause is supported");

      const auto &rc = q.reading.front();
      if (rc.optional)
        throw ExecutionError("OPTIONAL MATCH is not supported");
      if (rc.where)
        throw ExecutionError("WHERE is not supported");
      if (rc.patterns.size() != 1)
        throw StructuralQueryError("exactly one match pattern is supported, got " + std::to_string(rc.patterns.size()));

      const auto &mp = rc.patterns.front();
      if (mp.variable)
        throw ExecutionError("path variables are not supported");
      if (mp.elements.empty() || mp.elements.size() % 2 == 0)
        throw StructuralQueryError("pattern must alternate node, edge, node and end with a node");
      return mp;
    }

    std::vector<Segment> build_segments(const MatchPattern &mp)
    {
      std::vector<Segment> segs;
      for (size_t i = 1; i < mp.elements.size(); i += 2)
      {
        const auto &e = edge_at(mp, i);
        const auto &target = node_at(mp, i + 1);

        if (!e.relTypes.empty())
          throw ExecutionError("relationship types are not supported");
        if (!e.properties.empty())
          throw ExecutionError("relationship properties are not supported");
        if (e.variable)
          throw ExecutionError("relationship variables are not supported");
        check_property_exprs(target.properties);

        // a plain edge walks the same window as a bare '*'
        Segment s{&target, to_direction(e.direction), e.minHops.value_or(1), e.maxHops.value_or(-1)};
        if (s.minHops < 0)
          throw StructuralQueryError("negative minimum hop count");
        if (s.maxHops >= 0 && s.minHops > s.maxHops)
          throw StructuralQueryError("minimum hop count exceeds maximum");
        segs.push_back(s);
      }
      return segs;
    }

    bool bind_variable(Row &row, const NodePattern &p, const Node &node)
    {
      if (!p.variable)
        return true;
      auto it = row.find(*p.variable);
      if (it != row.end())
        return it->second.id == node.id;
      row.emplace(*p.variable, node);
      return true;
    }

    std::vector<Binding> expand(const std::vector<Binding> &in, const Segment &seg, const Store &store)
    {
      std::vector<Binding> out;
      for (const auto &b : in)
      {
        traverse::DfsOptions opts{};
        opts.direction = seg.direction;
        opts.maxDepth = seg.maxHops > std::numeric_limits<int>::max() ? -1 : static_cast<int>(seg.maxHops);

        std::optional<traverse::Dfs> dfs;
        try
        {
          dfs.emplace(store, b.end.id, opts);
        }
        catch (const NotFound &)
        {
          // removed since it was matched
          continue;
        }

        dfs->iterate([&](const traverse::Visit &v)
                     {
                       if (v.depth < seg.minHops)
                         return;
                       if (seg.maxHops >= 0 && v.depth > seg.maxHops)
                         return;
                       if (!nodeMatches(v.node, *seg.target))
                         return;
                       Binding next{b.row, b.start, v.node};
                       if (bind_variable(next.row, *seg.target, v.node))
                         out.push_back(std::move(next)); });
      }
      return out;
    }

    // First binding per (start, end) pair wins, whatever the intermediate nodes.
    void dedup_endpoints(std::vector<Binding> &bindings)
    {
      std::set<std::pair<std::string, std::string>> seen;
      std::vector<Binding> kept;
      kept.reserve(bindings.size());
      for (auto &b : bindings)
        if (seen.emplace(b.start, b.end.id).second)
          kept.push_back(std::move(b));
      bindings = std::move(kept);
    }

    int64_t row_limit(const std::optional<Expr> &e, const char *what)
    {
      const auto *lit = std::get_if<IntegerLiteral>(&*e);
      if (lit == nullptr)
        throw ExecutionError(std::string(what) + " must be an integer literal");
      if (lit->value < 0)
        throw ExecutionError(std::string(what) + " must not be negative");
      return lit->value;
    }

    void sort_rows(std::vector<Row> &rows, const std::vector<OrderBy> &order, const std::set<std::string> &bound)
    {
      std::vector<std::pair<std::string, SortDirection>> keys;
      for (const auto &ob : order)
      {
        const auto *v = std::get_if<Variable>(&ob.item);
        if (v == nullptr)
          continue; // constant key
        if (!bound.count(v->name))
          throw ExecutionError("ORDER BY references unbound variable " + v->name);
        keys.emplace_back(v->name, ob.direction);
      }
      if (keys.empty())
        return;

      std::stable_sort(rows.begin(), rows.end(), [&](const Row &a, const Row &b)
                       {
                         for (const auto &[name, dir] : keys)
                         {
                           const auto &x = a.at(name).id;
                           const auto &y = b.at(name).id;
                           if (x == y)
                             continue;
                           return dir == SortDirection::Ascending ? x < y : y < x;
                         }
                         return false; });
    }

  } // namespace

  // -------------------- matching --------------------

  bool literalMatches(const Expr &literal, const Value &stored)
  {
    return std::visit(overloaded{
                          [&](const Variable &v) -> bool
                          {
                            throw ExecutionError("cannot compare variable " + v.name + " with a stored value");
                          },
                          [&](const StrLiteral &s) -> bool
                          {
                            auto text = value_text(stored);
                            return text && *text == s.value;
                          },
                          [&](const IntegerLiteral &i) -> bool
                          { return integer_equals(stored, i.value); },
                      },
                      literal);
  }

  bool nodeMatches(const Node &node, const NodePattern &pattern)
  {
    for (const auto &l : pattern.labels)
      if (!node.labels.count(l))
        return false;
    for (const auto &[key, expr] : pattern.properties)
    {
      auto it = node.properties.find(key);
      if (it == node.properties.end())
        return false;
      if (!literalMatches(expr, it->second))
        return false;
    }
    return true;
  }

  // -------------------- execution --------------------

  std::vector<Row> executeQuery(const Query &query, const Store &store)
  {
    const auto &q = query.root;
    const auto &mp = check_shape(q);
    const auto &first = node_at(mp, 0);
    check_property_exprs(first.properties);
    auto segments = build_segments(mp);

    std::set<std::string> bound;
    for (size_t i = 0; i < mp.elements.size(); i += 2)
    {
      const auto &n = node_at(mp, i);
      if (n.variable)
        bound.insert(*n.variable);
    }

    for (const auto &item : q.returnItems)
    {
      const auto *v = std::get_if<Variable>(&item);
      if (v == nullptr)
        throw ExecutionError("RETURN supports variables only, got " + toString(item));
      if (!bound.count(v->name))
        throw ExecutionError("RETURN references unbound variable " + v->name);
    }
    if (q.returnItems.empty())
      throw StructuralQueryError("RETURN needs at least one item");

    // start candidates in id order so results are reproducible
    auto nodes = store.allNodes();
    std::sort(nodes.begin(), nodes.end(), [](const Node &a, const Node &b)
              { return a.id < b.id; });

    std::vector<Binding> bindings;
    for (auto &n : nodes)
    {
      if (!nodeMatches(n, first))
        continue;
      Binding b{};
      bind_variable(b.row, first, n);
      b.start = n.id;
      b.end = std::move(n);
      bindings.push_back(std::move(b));
    }

    for (const auto &seg : segments)
      bindings = expand(bindings, seg, store);
    dedup_endpoints(bindings);

    std::vector<Row> rows;
    rows.reserve(bindings.size());
    for (auto &b : bindings)
      rows.push_back(std::move(b.row));

    sort_rows(rows, q.order, bound);

    std::vector<Row> projected;
    projected.reserve(rows.size());
    for (const auto &r : rows)
    {
      Row p;
      for (const auto &item : q.returnItems)
      {
        const auto &name = std::get<Variable>(item).name;
        p.emplace(name, r.at(name));
      }
      if (q.distinct && std::find(projected.begin(), projected.end(), p) != projected.end())
        continue;
      projected.push_back(std::move(p));
    }

    if (q.skip)
    {
      auto skip = row_limit(q.skip, "SKIP");
      if (static_cast<uint64_t>(skip) >= projected.size())
        projected.clear();
      else
        projected.erase(projected.begin(), projected.begin() + skip);
    }
    if (q.limit)
    {
      auto limit = row_limit(q.limit, "LIMIT");
      if (static_cast<uint64_t>(limit) < projected.size())
        projected.resize(static_cast<size_t>(limit));
    }
    return projected;
  }

  std::vector<Row> executeQuery(std::string_view text, const Store &store)
  {
    return executeQuery(parseQuery(text), store);
  }

} // namespace quasar::cypher
