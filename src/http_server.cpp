#include "http_server.hpp"
#include "executor.hpp"
#include "snapshot.hpp"

#include <mongoose.h>

#include <thread>
#include <charconv>
#include <cstring>
#include <vector>
#include <variant>
#include <string>
#include <cstdlib>
#include <utility>
#include <kj/debug.h>

namespace quasar::http
{

  namespace
  {
    struct ServerState
    {
      quasar::Store *store{nullptr};
      std::string snapshotPath;
    };

    // helpers -----------------------------------------------------------------
    static bool parseUint32(const mg_str &s, uint32_t &out)
    {
      out = 0;
      if (s.len == 0)
        return false;
      const char *b = s.buf;
      const char *e = s.buf + s.len;
      auto res = std::from_chars(b, e, out);
      return res.ec == std::errc{} && res.ptr == e;
    }

    static bool parseDouble(const mg_str &s, double &out)
    {
      out = 0;
      if (s.len == 0)
        return false;
      std::string tmp(s.buf, s.len);
      char *endp = nullptr;
      out = std::strtod(tmp.c_str(), &endp);
      return endp != nullptr && *endp == '\0';
    }

    static bool strEquals(const mg_str &s, const char *lit)
    {
      size_t n = strlen(lit);
      return s.len == n && memcmp(s.buf, lit, n) == 0;
    }

    static quasar::Direction parseDirection(const mg_str &s)
    {
      if (strEquals(s, "out"))
        return quasar::Direction::Out;
      if (strEquals(s, "in"))
        return quasar::Direction::In;
      return quasar::Direction::Both;
    }

    // Split CSV into slices over the provided buffer
    static void splitCsv(const mg_str &s, std::vector<mg_str> &out)
    {
      size_t start = 0;
      for (size_t i = 0; i <= (size_t)s.len; ++i)
      {
        if (i == (size_t)s.len || s.buf[i] == ',')
        {
          mg_str part = mg_str_n(s.buf + start, (size_t)(i - start));
          if (part.len > 0)
            out.push_back(part);
          start = i + 1;
        }
      }
    }

    // "k=v,k2=v2"; entries without '=' are skipped
    static void parseKvList(const mg_str &s, std::vector<std::pair<mg_str, mg_str>> &out)
    {
      std::vector<mg_str> parts;
      splitCsv(s, parts);
      for (const auto &part : parts)
      {
        const char *eq = static_cast<const char *>(memchr(part.buf, '=', part.len));
        if (eq == nullptr)
          continue;
        size_t klen = (size_t)(eq - part.buf);
        out.emplace_back(mg_str_n(part.buf, klen), mg_str_n(eq + 1, part.len - klen - 1));
      }
    }

    static quasar::Value parseValue(const mg_str &s)
    {
      if (strEquals(s, "true"))
        return true;
      if (strEquals(s, "false"))
        return false;
      if (strEquals(s, "null"))
        return std::monostate{};

      const char *b = s.buf;
      const char *e = s.buf + s.len;
      int64_t i64{};
      auto ri = std::from_chars(b, e, i64);
      if (s.len > 0 && ri.ec == std::errc{} && ri.ptr == e)
        return i64;
      double d{};
      if (parseDouble(s, d))
        return d;
      return std::string(s.buf, s.len);
    }

    static quasar::Properties parseProps(const mg_str &s)
    {
      std::vector<std::pair<mg_str, mg_str>> kvs;
      parseKvList(s, kvs);
      quasar::Properties out;
      for (const auto &[k, v] : kvs)
        out[std::string(k.buf, k.len)] = parseValue(v);
      return out;
    }

    // returns the decoded length, 0 when the variable is absent or empty
    static int getVar(struct mg_http_message *hm, const char *name, char *buf, size_t len)
    {
      int n = mg_http_get_var(&hm->query, name, buf, len);
      return n > 0 ? n : 0;
    }

    static std::string requireVar(struct mg_http_message *hm, const char *name)
    {
      char buf[1024];
      int n = getVar(hm, name, buf, sizeof(buf));
      if (n == 0)
        throw quasar::InvalidInput(std::string("missing ") + name);
      return std::string(buf, (size_t)n);
    }

    // JSON helpers -----------------------------------------------------------------
    static size_t print_value_json(mg_pfn_t out, void *arg, const quasar::Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
        return mg_xprintf(out, arg, "%lld", (long long)std::get<int64_t>(v));
      if (std::holds_alternative<uint64_t>(v))
        return mg_xprintf(out, arg, "%llu", (unsigned long long)std::get<uint64_t>(v));
      if (std::holds_alternative<double>(v))
        return mg_xprintf(out, arg, "%g", std::get<double>(v));
      if (std::holds_alternative<bool>(v))
        return mg_xprintf(out, arg, "%s", std::get<bool>(v) ? "true" : "false");
      if (std::holds_alternative<std::string>(v))
        return mg_xprintf(out, arg, "%m", MG_ESC(std::get<std::string>(v).c_str()));
      return mg_xprintf(out, arg, "null");
    }

    static size_t print_node(mg_pfn_t out, void *arg, va_list *ap)
    {
      const quasar::Node *n = va_arg(*ap, const quasar::Node *);
      size_t len = mg_xprintf(out, arg, "{%m:%m,%m:[", MG_ESC("id"), MG_ESC(n->id.c_str()), MG_ESC("labels"));
      size_t i = 0;
      for (const auto &l : n->labels)
        len += mg_xprintf(out, arg, "%s%m", i++ ? "," : "", MG_ESC(l.c_str()));
      len += mg_xprintf(out, arg, "],%m:{", MG_ESC("properties"));
      i = 0;
      for (const auto &[k, v] : n->properties)
      {
        len += mg_xprintf(out, arg, "%s%m:", i++ ? "," : "", MG_ESC(k.c_str()));
        len += print_value_json(out, arg, v);
      }
      len += mg_xprintf(out, arg, "}}");
      return len;
    }

    static size_t print_edge(mg_pfn_t out, void *arg, const quasar::Edge &e)
    {
      return mg_xprintf(out, arg, "{%m:%m,%m:%m,%m:%g}",
                        MG_ESC("from"), MG_ESC(e.from.c_str()),
                        MG_ESC("to"), MG_ESC(e.to.c_str()),
                        MG_ESC("weight"), e.weight);
    }

    static size_t print_edges_array(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<quasar::Edge> *edges = va_arg(*ap, const std::vector<quasar::Edge> *);
      size_t len = mg_xprintf(out, arg, "[");
      for (size_t i = 0; i < edges->size(); ++i)
      {
        len += mg_xprintf(out, arg, "%s", i ? "," : "");
        len += print_edge(out, arg, (*edges)[i]);
      }
      len += mg_xprintf(out, arg, "]");
      return len;
    }

    static size_t print_edge_object(mg_pfn_t out, void *arg, va_list *ap)
    {
      const quasar::Edge *e = va_arg(*ap, const quasar::Edge *);
      return print_edge(out, arg, *e);
    }

    static size_t print_string_array(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<std::string> *items = va_arg(*ap, const std::vector<std::string> *);
      size_t len = mg_xprintf(out, arg, "[");
      for (size_t i = 0; i < items->size(); ++i)
        len += mg_xprintf(out, arg, "%s%m", i ? "," : "", MG_ESC((*items)[i].c_str()));
      len += mg_xprintf(out, arg, "]");
      return len;
    }

    static size_t print_rows(mg_pfn_t out, void *arg, va_list *ap)
    {
      const std::vector<quasar::cypher::Row> *rows = va_arg(*ap, const std::vector<quasar::cypher::Row> *);
      size_t len = mg_xprintf(out, arg, "[");
      for (size_t i = 0; i < rows->size(); ++i)
      {
        len += mg_xprintf(out, arg, "%s{", i ? "," : "");
        size_t j = 0;
        for (const auto &[name, node] : (*rows)[i])
          len += mg_xprintf(out, arg, "%s%m:%M", j++ ? "," : "", MG_ESC(name.c_str()), print_node, &node);
        len += mg_xprintf(out, arg, "}");
      }
      len += mg_xprintf(out, arg, "]");
      return len;
    }

    // Common reply helper that adds CORS headers to JSON responses
    template <typename... Args>
    static void reply_json(struct mg_connection *c, int code, const char *fmt, Args &&...args)
    {
      mg_http_reply(c, code,
                    "Content-Type: application/json\r\n"
                    "Access-Control-Allow-Origin: *\r\n"
                    "Access-Control-Allow-Methods: GET, POST, PUT, DELETE, OPTIONS\r\n"
                    "Access-Control-Allow-Headers: Content-Type, Authorization, X-Requested-With\r\n",
                    fmt, std::forward<Args>(args)...);
    }

    static void reply_error(struct mg_connection *c, int code, const char *kind, const char *what)
    {
      reply_json(c, code, "{%m:%m,%m:%m}\n", MG_ESC("error"), MG_ESC(kind), MG_ESC("message"), MG_ESC(what));
    }

    static int statusFor(quasar::ErrorCode code)
    {
      switch (code)
      {
      case quasar::ErrorCode::NotFound:
        return 404;
      case quasar::ErrorCode::AlreadyExists:
        return 409;
      case quasar::ErrorCode::Snapshot:
        return 500;
      case quasar::ErrorCode::InvalidInput:
      default:
        return 400;
      }
    }

    // HTTP handlers -----------------------------------------------------------------
    static void handle_health(struct mg_connection *c)
    {
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_add_node(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      quasar::AddNodeParams in{};
      in.id = requireVar(hm, "id");

      char labelsBuf[1024], propsBuf[4096];
      int nl = getVar(hm, "labels", labelsBuf, sizeof(labelsBuf));
      if (nl > 0)
      {
        std::vector<mg_str> parts;
        splitCsv(mg_str_n(labelsBuf, (size_t)nl), parts);
        for (auto p : parts)
          in.labels.insert(std::string(p.buf, p.len));
      }
      int np = getVar(hm, "props", propsBuf, sizeof(propsBuf));
      if (np > 0)
        in.properties = parseProps(mg_str_n(propsBuf, (size_t)np));

      st->store->addNode(in);
      reply_json(c, 200, "{%m:%m}\n", MG_ESC("id"), MG_ESC(in.id.c_str()));
    }

    static void handle_get_node(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto node = st->store->getNode(requireVar(hm, "id"));
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("node"), print_node, &node);
    }

    static void handle_delete_node(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      st->store->removeNode(requireVar(hm, "id"));
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_upsert_node_props(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      quasar::UpsertNodePropsParams in{};
      in.id = requireVar(hm, "id");

      char setBuf[4096], unsetBuf[4096];
      int ns = getVar(hm, "set", setBuf, sizeof(setBuf));
      if (ns > 0)
        in.set = parseProps(mg_str_n(setBuf, (size_t)ns));
      int nu = getVar(hm, "unset", unsetBuf, sizeof(unsetBuf));
      if (nu > 0)
      {
        std::vector<mg_str> parts;
        splitCsv(mg_str_n(unsetBuf, (size_t)nu), parts);
        for (auto p : parts)
          in.unsetKeys.push_back(std::string(p.buf, p.len));
      }
      st->store->upsertNodeProps(in);
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_set_node_labels(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      quasar::SetNodeLabelsParams in{};
      in.id = requireVar(hm, "id");

      char addBuf[1024], removeBuf[1024];
      int na = getVar(hm, "add", addBuf, sizeof(addBuf));
      if (na > 0)
      {
        std::vector<mg_str> parts;
        splitCsv(mg_str_n(addBuf, (size_t)na), parts);
        for (auto p : parts)
          in.addLabels.push_back(std::string(p.buf, p.len));
      }
      int nr = getVar(hm, "remove", removeBuf, sizeof(removeBuf));
      if (nr > 0)
      {
        std::vector<mg_str> parts;
        splitCsv(mg_str_n(removeBuf, (size_t)nr), parts);
        for (auto p : parts)
          in.removeLabels.push_back(std::string(p.buf, p.len));
      }
      st->store->setNodeLabels(in);
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static double weightVar(struct mg_http_message *hm)
    {
      char buf[64];
      int n = getVar(hm, "weight", buf, sizeof(buf));
      if (n == 0)
        return 0.0;
      double w{};
      if (!parseDouble(mg_str_n(buf, (size_t)n), w))
        throw quasar::InvalidInput("weight must be a number");
      return w;
    }

    static void handle_add_edge(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      st->store->addEdge(requireVar(hm, "from"), requireVar(hm, "to"), weightVar(hm));
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_update_edge(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      st->store->updateEdge(requireVar(hm, "from"), requireVar(hm, "to"), weightVar(hm));
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_get_edge(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto e = st->store->getEdge(requireVar(hm, "from"), requireVar(hm, "to"));
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("edge"), print_edge_object, &e);
    }

    static void handle_delete_edge(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      st->store->removeEdge(requireVar(hm, "from"), requireVar(hm, "to"));
      reply_json(c, 200, "{\"ok\":true}\n");
    }

    static void handle_list_edges(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::string id = requireVar(hm, "id");
      char dirBuf[16];
      int nd = getVar(hm, "direction", dirBuf, sizeof(dirBuf));
      auto dir = nd > 0 ? parseDirection(mg_str_n(dirBuf, (size_t)nd)) : quasar::Direction::Out;

      std::vector<quasar::Edge> edges;
      if (dir == quasar::Direction::Out || dir == quasar::Direction::Both)
        edges = st->store->getOutEdges(id);
      if (dir == quasar::Direction::In || dir == quasar::Direction::Both)
      {
        auto in = st->store->getInEdges(id);
        edges.insert(edges.end(), in.begin(), in.end());
      }
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("edges"), print_edges_array, &edges);
    }

    static void handle_degree(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::string id = requireVar(hm, "id");
      char dirBuf[16];
      int nd = getVar(hm, "direction", dirBuf, sizeof(dirBuf));
      auto dir = nd > 0 ? parseDirection(mg_str_n(dirBuf, (size_t)nd)) : quasar::Direction::Both;
      auto count = st->store->degree(id, dir);
      reply_json(c, 200, "{%m:%llu}\n", MG_ESC("count"), (unsigned long long)count);
    }

    static void handle_scan_nodes_by_label(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::string label = requireVar(hm, "label");
      uint32_t limit = 0;
      char limitBuf[32];
      int nl = getVar(hm, "limit", limitBuf, sizeof(limitBuf));
      if (nl > 0 && !parseUint32(mg_str_n(limitBuf, (size_t)nl), limit))
        throw quasar::InvalidInput("limit must be an unsigned integer");
      auto ids = st->store->scanNodesByLabel(label, limit);
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("ids"), print_string_array, &ids);
    }

    static void handle_query(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      std::string text(hm->body.buf, hm->body.len);
      if (text.empty())
        throw quasar::InvalidInput("empty query");
      KJ_LOG(INFO, "query", text);
      auto rows = quasar::cypher::executeQuery(text, *st->store);
      reply_json(c, 200, "{%m:%M}\n", MG_ESC("rows"), print_rows, &rows);
    }

    static void handle_save(struct mg_connection *c, ServerState *st)
    {
      if (st->snapshotPath.empty())
        throw quasar::InvalidInput("no snapshot path configured");
      auto stats = quasar::snapshot::saveToFile(*st->store, st->snapshotPath);
      reply_json(c, 200, "{%m:%llu,%m:%llu}\n",
                 MG_ESC("nodes"), (unsigned long long)stats.nodes,
                 MG_ESC("edges"), (unsigned long long)stats.edges);
    }

    static bool route(struct mg_connection *c, ServerState *st, struct mg_http_message *hm)
    {
      auto is = [&](const char *method, const char *uri)
      {
        return strEquals(hm->method, method) && mg_match(hm->uri, mg_str(uri), NULL);
      };

      if (mg_match(hm->uri, mg_str("/api/health"), NULL))
        handle_health(c);
      else if (is("POST", "/api/node"))
        handle_add_node(c, st, hm);
      else if (is("GET", "/api/node"))
        handle_get_node(c, st, hm);
      else if (is("DELETE", "/api/node"))
        handle_delete_node(c, st, hm);
      else if (is("POST", "/api/nodeProps"))
        handle_upsert_node_props(c, st, hm);
      else if (is("POST", "/api/nodeLabels"))
        handle_set_node_labels(c, st, hm);
      else if (is("POST", "/api/edge"))
        handle_add_edge(c, st, hm);
      else if (is("PUT", "/api/edge"))
        handle_update_edge(c, st, hm);
      else if (is("GET", "/api/edge"))
        handle_get_edge(c, st, hm);
      else if (is("DELETE", "/api/edge"))
        handle_delete_edge(c, st, hm);
      else if (is("GET", "/api/edges"))
        handle_list_edges(c, st, hm);
      else if (is("GET", "/api/degree"))
        handle_degree(c, st, hm);
      else if (is("GET", "/api/scanNodesByLabel"))
        handle_scan_nodes_by_label(c, st, hm);
      else if (is("POST", "/api/query"))
        handle_query(c, st, hm);
      else if (is("POST", "/api/save"))
        handle_save(c, st);
      else
        return false;
      return true;
    }

    static void ev_handler(struct mg_connection *c, int ev, void *ev_data)
    {
      if (ev != MG_EV_HTTP_MSG)
        return;

      auto *hm = (struct mg_http_message *)ev_data;
      auto *st = (ServerState *)c->fn_data;

      KJ_LOG(INFO, "ev_handler",
             std::string(hm->method.buf, (size_t)hm->method.len),
             std::string(hm->uri.buf, (size_t)hm->uri.len));

      // Handle CORS preflight
      if (strEquals(hm->method, "OPTIONS"))
      {
        mg_http_reply(c, 204,
                      "Access-Control-Allow-Origin: *\r\n"
                      "Access-Control-Allow-Methods: GET, POST, PUT, DELETE, OPTIONS\r\n"
                      "Access-Control-Allow-Headers: Content-Type, Authorization, X-Requested-With\r\n"
                      "Access-Control-Max-Age: 86400\r\n",
                      "");
        return;
      }

      try
      {
        if (!route(c, st, hm))
        {
          KJ_LOG(WARNING, "dispatch: not found");
          reply_json(c, 404, "{\"error\":\"not found\"}\n");
        }
      }
      catch (const quasar::GraphError &e)
      {
        KJ_LOG(WARNING, "request rejected", quasar::errorCodeName(e.code), e.what());
        reply_error(c, statusFor(e.code), quasar::errorCodeName(e.code), e.what());
      }
      catch (const quasar::cypher::ParseError &e)
      {
        KJ_LOG(WARNING, "query rejected", e.what());
        reply_error(c, 400, "ParseError", e.what());
      }
      catch (const quasar::cypher::QueryError &e)
      {
        KJ_LOG(WARNING, "query failed", e.what());
        reply_error(c, 422, "QueryError", e.what());
      }
      catch (const std::exception &e)
      {
        KJ_LOG(ERROR, "internal error", e.what());
        reply_error(c, 500, "Internal", e.what());
      }
      catch (const kj::Exception &e)
      {
        KJ_LOG(ERROR, "internal error", e.getDescription());
        reply_error(c, 500, "Internal", e.getDescription().cStr());
      }
    }

    void run_loop(struct mg_mgr *mgr)
    {
      for (;;)
      {
        mg_mgr_poll(mgr, 250);
      }
    }
  } // namespace

  void startHttpServer(quasar::Store &store, const std::string &bind, const std::string &snapshotPath)
  {
    std::thread([&store, bind, snapshotPath]()
                {
      struct mg_mgr mgr{};
      mg_mgr_init(&mgr);

      ServerState st{.store = &store, .snapshotPath = snapshotPath};
      struct mg_connection *c = mg_http_listen(&mgr, bind.c_str(), ev_handler, &st);
      if (c == nullptr)
      {
        KJ_LOG(ERROR, "http listen failed", bind);
        mg_mgr_free(&mgr);
        return;
      }
      run_loop(&mgr);
      mg_mgr_free(&mgr); })
        .detach();
  }

} // namespace quasar::http
