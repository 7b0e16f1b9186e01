#include "snapshot.hpp"
#include <mongoose.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <kj/debug.h>

namespace quasar::snapshot
{

  namespace
  {

    // -------------------- writing --------------------

    // length-aware, so embedded NULs are written as \u0000
    void write_str(std::string &out, const std::string &s)
    {
      out += '"';
      for (char ch : s)
      {
        switch (ch)
        {
        case '"':
          out += "\\\"";
          break;
        case '\\':
          out += "\\\\";
          break;
        case '\n':
          out += "\\n";
          break;
        case '\r':
          out += "\\r";
          break;
        case '\t':
          out += "\\t";
          break;
        case '\b':
          out += "\\b";
          break;
        case '\f':
          out += "\\f";
          break;
        default:
          if (static_cast<unsigned char>(ch) < 0x20)
          {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
            out += buf;
          }
          else
            out += ch;
        }
      }
      out += '"';
    }

    void write_double(std::string &out, double d)
    {
      if (!std::isfinite(d))
      {
        out += "null";
        return;
      }
      char buf[40];
      int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
      std::string text(buf, static_cast<size_t>(n));
      // keep a marker so the value reads back as a double
      if (text.find_first_of(".eE") == std::string::npos)
        text += ".0";
      out += text;
    }

    void write_value(std::string &out, const Value &v)
    {
      if (const auto *i = std::get_if<int64_t>(&v))
        out += std::to_string(*i);
      else if (const auto *u = std::get_if<uint64_t>(&v))
        out += std::to_string(*u);
      else if (const auto *d = std::get_if<double>(&v))
        write_double(out, *d);
      else if (const auto *b = std::get_if<bool>(&v))
        out += *b ? "true" : "false";
      else if (const auto *s = std::get_if<std::string>(&v))
        write_str(out, *s);
      else
        out += "null";
    }

    void write_node(std::string &out, const Node &n)
    {
      out += "{";
      write_str(out, "id");
      out += ": ";
      write_str(out, n.id);
      out += ", ";
      write_str(out, "labels");
      out += ": [";
      bool first = true;
      for (const auto &l : n.labels)
      {
        if (!first)
          out += ", ";
        first = false;
        write_str(out, l);
      }
      out += "], ";
      write_str(out, "properties");
      out += ": {";
      first = true;
      for (const auto &[k, v] : n.properties)
      {
        if (!first)
          out += ", ";
        first = false;
        write_str(out, k);
        out += ": ";
        write_value(out, v);
      }
      out += "}}";
    }

    void write_edge(std::string &out, const Edge &e)
    {
      out += "{";
      write_str(out, "from");
      out += ": ";
      write_str(out, e.from);
      out += ", ";
      write_str(out, "to");
      out += ": ";
      write_str(out, e.to);
      out += ", ";
      write_str(out, "weight");
      out += ": ";
      write_double(out, e.weight);
      out += "}";
    }

    // -------------------- reading --------------------

    bool present(const mg_str &tok)
    {
      return tok.buf != nullptr && tok.len > 0;
    }

    std::string_view view(const mg_str &tok)
    {
      return std::string_view(tok.buf, tok.len);
    }

    void append_utf8(std::string &out, unsigned cp)
    {
      if (cp < 0x80)
        out += static_cast<char>(cp);
      else if (cp < 0x800)
      {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
      else
      {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
    }

    // Unescaped text of a JSON string token. Decoded by length so a \u0000
    // escape stays part of the value.
    std::string read_str(const mg_str &tok, const std::string &what)
    {
      if (!present(tok) || tok.len < 2 || tok.buf[0] != '"' || tok.buf[tok.len - 1] != '"')
        throw SnapshotError(what + " must be a string");

      std::string out;
      const char *p = tok.buf + 1;
      const char *end = tok.buf + tok.len - 1;
      while (p < end)
      {
        if (*p != '\\')
        {
          out += *p++;
          continue;
        }
        if (++p == end)
          throw SnapshotError(what + " is not a valid string");
        switch (*p++)
        {
        case '"':
          out += '"';
          break;
        case '\\':
          out += '\\';
          break;
        case '/':
          out += '/';
          break;
        case 'b':
          out += '\b';
          break;
        case 'f':
          out += '\f';
          break;
        case 'n':
          out += '\n';
          break;
        case 'r':
          out += '\r';
          break;
        case 't':
          out += '\t';
          break;
        case 'u':
        {
          unsigned cp = 0;
          if (end - p < 4)
            throw SnapshotError(what + " has a truncated \\u escape");
          auto [ptr, ec] = std::from_chars(p, p + 4, cp, 16);
          if (ec != std::errc() || ptr != p + 4)
            throw SnapshotError(what + " has a bad \\u escape");
          append_utf8(out, cp);
          p += 4;
          break;
        }
        default:
          throw SnapshotError(what + " is not a valid string");
        }
      }
      return out;
    }

    double read_double(const mg_str &tok, const std::string &what)
    {
      double d = 0;
      auto sv = view(tok);
      auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), d);
      if (ec != std::errc() || ptr != sv.data() + sv.size())
        throw SnapshotError(what + " must be a number");
      return d;
    }

    // integers stay integers; anything with a fraction or exponent is a double
    Value read_number(const mg_str &tok, const std::string &what)
    {
      auto sv = view(tok);
      if (sv.find_first_of(".eE") != std::string_view::npos)
        return read_double(tok, what);

      int64_t i = 0;
      auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), i);
      if (ec == std::errc() && ptr == sv.data() + sv.size())
        return i;

      uint64_t u = 0;
      auto [uptr, uec] = std::from_chars(sv.data(), sv.data() + sv.size(), u);
      if (uec == std::errc() && uptr == sv.data() + sv.size())
        return u;

      return read_double(tok, what);
    }

    Value read_value(const mg_str &tok, const std::string &what)
    {
      if (!present(tok))
        throw SnapshotError(what + " is missing");
      auto sv = view(tok);
      switch (sv.front())
      {
      case '"':
        return read_str(tok, what);
      case 't':
        return true;
      case 'f':
        return false;
      case 'n':
        return std::monostate{};
      case '{':
      case '[':
        throw SnapshotError(what + ": nested values are not supported");
      default:
        return read_number(tok, what);
      }
    }

    void require_kind(const mg_str &tok, char open, const std::string &what)
    {
      if (!present(tok) || tok.buf[0] != open)
        throw SnapshotError(what + (open == '[' ? " must be an array" : " must be an object"));
    }

    Node read_node(const mg_str &obj, size_t index)
    {
      const std::string where = "nodes[" + std::to_string(index) + "]";
      require_kind(obj, '{', where);

      Node n{};
      n.id = read_str(mg_json_get_tok(obj, "$.id"), where + ".id");

      mg_str labels = mg_json_get_tok(obj, "$.labels");
      if (present(labels) && labels.buf[0] != 'n')
      {
        require_kind(labels, '[', where + ".labels");
        size_t ofs = 0;
        mg_str key{}, val{};
        while ((ofs = mg_json_next(labels, ofs, &key, &val)) > 0)
          n.labels.insert(read_str(val, where + ".labels"));
      }

      mg_str props = mg_json_get_tok(obj, "$.properties");
      if (present(props) && props.buf[0] != 'n')
      {
        require_kind(props, '{', where + ".properties");
        size_t ofs = 0;
        mg_str key{}, val{};
        while ((ofs = mg_json_next(props, ofs, &key, &val)) > 0)
        {
          std::string k = read_str(key, where + ".properties key");
          n.properties[k] = read_value(val, where + ".properties." + k);
        }
      }
      return n;
    }

    Edge read_edge(const mg_str &obj, size_t index)
    {
      const std::string where = "edges[" + std::to_string(index) + "]";
      require_kind(obj, '{', where);

      Edge e{};
      e.from = read_str(mg_json_get_tok(obj, "$.from"), where + ".from");
      e.to = read_str(mg_json_get_tok(obj, "$.to"), where + ".to");
      mg_str w = mg_json_get_tok(obj, "$.weight");
      if (present(w) && w.buf[0] == 'n')
        e.weight = std::nan("");
      else if (present(w))
        e.weight = read_double(w, where + ".weight");
      return e;
    }

  } // namespace

  // -------------------- api ---------------------------

  std::string toJson(const GraphDump &dump)
  {
    std::vector<const Node *> nodes;
    nodes.reserve(dump.nodes.size());
    for (const auto &n : dump.nodes)
      nodes.push_back(&n);
    std::sort(nodes.begin(), nodes.end(), [](const Node *a, const Node *b)
              { return a->id < b->id; });

    std::vector<const Edge *> edges;
    edges.reserve(dump.edges.size());
    for (const auto &e : dump.edges)
      edges.push_back(&e);
    std::sort(edges.begin(), edges.end(), [](const Edge *a, const Edge *b)
              { return a->from != b->from ? a->from < b->from : a->to < b->to; });

    std::string out = "{\n  \"nodes\": [";
    for (size_t i = 0; i < nodes.size(); ++i)
    {
      out += i ? ",\n    " : "\n    ";
      write_node(out, *nodes[i]);
    }
    out += nodes.empty() ? "],\n" : "\n  ],\n";
    out += "  \"edges\": [";
    for (size_t i = 0; i < edges.size(); ++i)
    {
      out += i ? ",\n    " : "\n    ";
      write_edge(out, *edges[i]);
    }
    out += edges.empty() ? "]\n}\n" : "\n  ]\n}\n";
    return out;
  }

  std::string toJson(const Store &store)
  {
    return toJson(store.dump());
  }

  GraphDump parseJson(std::string_view json)
  {
    mg_str doc = mg_str_n(json.data(), json.size());
    int toklen = 0;
    if (mg_json_get(doc, "$", &toklen) < 0)
      throw SnapshotError("document is not valid JSON");
    mg_str root = mg_json_get_tok(doc, "$");
    require_kind(root, '{', "document");

    GraphDump dump{};
    mg_str nodes = mg_json_get_tok(doc, "$.nodes");
    if (present(nodes) && nodes.buf[0] != 'n')
    {
      require_kind(nodes, '[', "nodes");
      size_t ofs = 0;
      mg_str key{}, val{};
      while ((ofs = mg_json_next(nodes, ofs, &key, &val)) > 0)
        dump.nodes.push_back(read_node(val, dump.nodes.size()));
    }

    mg_str edges = mg_json_get_tok(doc, "$.edges");
    if (present(edges) && edges.buf[0] != 'n')
    {
      require_kind(edges, '[', "edges");
      size_t ofs = 0;
      mg_str key{}, val{};
      while ((ofs = mg_json_next(edges, ofs, &key, &val)) > 0)
        dump.edges.push_back(read_edge(val, dump.edges.size()));
    }
    return dump;
  }

  void fromJson(Store &store, std::string_view json)
  {
    store.replace(parseJson(json));
  }

  SnapshotStats saveToFile(const Store &store, const std::string &path)
  {
    auto dump = store.dump();
    std::string text = toJson(dump);

    // write beside the target and rename so a failed write leaves the old file intact
    std::string tmp = path + ".tmp";
    {
      std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
      if (!f)
        throw SnapshotError("cannot open " + tmp + " for writing");
      f.write(text.data(), static_cast<std::streamsize>(text.size()));
      f.flush();
      if (!f)
        throw SnapshotError("write failed: " + tmp);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec)
      throw SnapshotError("cannot replace " + path + ": " + ec.message());

    KJ_LOG(INFO, "snapshot saved", path, dump.nodes.size(), dump.edges.size());
    return SnapshotStats{dump.nodes.size(), dump.edges.size()};
  }

  SnapshotStats loadFromFile(Store &store, const std::string &path)
  {
    std::ifstream f(path, std::ios::binary);
    if (!f)
      throw SnapshotError("cannot open " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad())
      throw SnapshotError("read failed: " + path);

    auto dump = parseJson(ss.str());
    store.replace(dump);
    KJ_LOG(INFO, "snapshot loaded", path, dump.nodes.size(), dump.edges.size());
    return SnapshotStats{dump.nodes.size(), dump.edges.size()};
  }

} // namespace quasar::snapshot
