#include "server.hpp"
#include "executor.hpp"
#include "snapshot.hpp"
#include "traverse.hpp"
#include <kj/debug.h>

namespace quasar::rpc
{

  namespace
  {

    quasar::Value fromRpcValue(Value::Reader v)
    {
      switch (v.which())
      {
      case Value::I64:
        return static_cast<int64_t>(v.getI64());
      case Value::U64:
        return static_cast<uint64_t>(v.getU64());
      case Value::F64:
        return static_cast<double>(v.getF64());
      case Value::BOOLV:
        return static_cast<bool>(v.getBoolv());
      case Value::TEXT:
        return std::string(v.getText().cStr());
      case Value::NULLV:
      default:
        return std::monostate{};
      }
    }

    void toRpcValue(Value::Builder b, const quasar::Value &v)
    {
      if (std::holds_alternative<int64_t>(v))
      {
        b.setI64(std::get<int64_t>(v));
        return;
      }
      if (std::holds_alternative<uint64_t>(v))
      {
        b.setU64(std::get<uint64_t>(v));
        return;
      }
      if (std::holds_alternative<double>(v))
      {
        b.setF64(std::get<double>(v));
        return;
      }
      if (std::holds_alternative<bool>(v))
      {
        b.setBoolv(std::get<bool>(v));
        return;
      }
      if (std::holds_alternative<std::string>(v))
      {
        b.setText(std::get<std::string>(v));
        return;
      }
      b.setNullv();
    }

    quasar::Properties fromRpcProperties(capnp::List<Property>::Reader props)
    {
      quasar::Properties out;
      for (auto p : props)
        out[std::string(p.getKey().cStr())] = fromRpcValue(p.getVal());
      return out;
    }

    template <typename Out>
    void toRpcTextList(capnp::List<capnp::Text>::Builder b, const Out &items)
    {
      uint32_t i = 0;
      for (const auto &s : items)
        b.set(i++, s);
    }

    void toRpcNode(Node::Builder b, const quasar::Node &n)
    {
      b.setId(n.id);
      toRpcTextList(b.initLabels(n.labels.size()), n.labels);
      auto props = b.initProps(n.properties.size());
      uint32_t i = 0;
      for (const auto &[k, v] : n.properties)
      {
        props[i].setKey(k);
        toRpcValue(props[i].initVal(), v);
        ++i;
      }
    }

    void toRpcEdge(Edge::Builder b, const quasar::Edge &e)
    {
      b.setFrom(e.from);
      b.setTo(e.to);
      b.setWeight(e.weight);
    }

    quasar::Direction fromRpcDirection(Direction d)
    {
      switch (d)
      {
      case Direction::OUT:
        return quasar::Direction::Out;
      case Direction::IN:
        return quasar::Direction::In;
      case Direction::BOTH:
      default:
        return quasar::Direction::Both;
      }
    }

  } // namespace

  QuasarImpl::QuasarImpl(quasar::Store &s, std::string snapshotPath) : store_(s), snapshotPath_(std::move(snapshotPath)) {}

  // -------------------- nodes --------------------

  kj::Promise<void> QuasarImpl::addNode(AddNodeContext ctx)
  {
    auto params = ctx.getParams().getParams();
    quasar::AddNodeParams in{};
    in.id = params.getId().cStr();
    for (auto l : params.getLabels())
      in.labels.insert(std::string(l.cStr()));
    in.properties = fromRpcProperties(params.getProps());
    store_.addNode(in);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::removeNode(RemoveNodeContext ctx)
  {
    store_.removeNode(ctx.getParams().getId().cStr());
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::upsertNodeProps(UpsertNodePropsContext ctx)
  {
    auto params = ctx.getParams().getParams();
    quasar::UpsertNodePropsParams in{};
    in.id = params.getId().cStr();
    in.set = fromRpcProperties(params.getSet());
    {
      auto uk = params.getUnsetKeys();
      in.unsetKeys.reserve(uk.size());
      for (auto k : uk)
        in.unsetKeys.push_back(std::string(k.cStr()));
    }
    store_.upsertNodeProps(in);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::setNodeLabels(SetNodeLabelsContext ctx)
  {
    auto params = ctx.getParams().getParams();
    quasar::SetNodeLabelsParams in{};
    in.id = params.getId().cStr();
    for (auto l : params.getAddLabels())
      in.addLabels.push_back(std::string(l.cStr()));
    for (auto l : params.getRemoveLabels())
      in.removeLabels.push_back(std::string(l.cStr()));
    store_.setNodeLabels(in);
    return kj::READY_NOW;
  }

  // -------------------- edges --------------------

  kj::Promise<void> QuasarImpl::addEdge(AddEdgeContext ctx)
  {
    auto p = ctx.getParams();
    store_.addEdge(p.getFrom().cStr(), p.getTo().cStr(), p.getWeight());
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::updateEdge(UpdateEdgeContext ctx)
  {
    auto p = ctx.getParams();
    store_.updateEdge(p.getFrom().cStr(), p.getTo().cStr(), p.getWeight());
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::removeEdge(RemoveEdgeContext ctx)
  {
    auto p = ctx.getParams();
    store_.removeEdge(p.getFrom().cStr(), p.getTo().cStr());
    return kj::READY_NOW;
  }

  // -------------------- reads --------------------

  kj::Promise<void> QuasarImpl::getNode(GetNodeContext ctx)
  {
    auto node = store_.getNode(ctx.getParams().getId().cStr());
    toRpcNode(ctx.getResults().initNode(), node);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::getEdge(GetEdgeContext ctx)
  {
    auto p = ctx.getParams();
    auto edge = store_.getEdge(p.getFrom().cStr(), p.getTo().cStr());
    toRpcEdge(ctx.getResults().initEdge(), edge);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::listEdges(ListEdgesContext ctx)
  {
    auto p = ctx.getParams();
    std::string id = p.getId().cStr();
    auto dir = fromRpcDirection(p.getDirection());

    std::vector<quasar::Edge> edges;
    if (dir == quasar::Direction::Out || dir == quasar::Direction::Both)
      edges = store_.getOutEdges(id);
    if (dir == quasar::Direction::In || dir == quasar::Direction::Both)
    {
      auto in = store_.getInEdges(id);
      edges.insert(edges.end(), in.begin(), in.end());
    }

    auto out = ctx.getResults().initEdges(edges.size());
    for (uint32_t i = 0; i < edges.size(); ++i)
      toRpcEdge(out[i], edges[i]);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::scanNodesByLabel(ScanNodesByLabelContext ctx)
  {
    auto p = ctx.getParams();
    auto ids = store_.scanNodesByLabel(p.getLabel().cStr(), p.getLimit());
    toRpcTextList(ctx.getResults().initIds(ids.size()), ids);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::degree(DegreeContext ctx)
  {
    auto p = ctx.getParams();
    auto count = store_.degree(p.getId().cStr(), fromRpcDirection(p.getDirection()));
    ctx.getResults().setCount(count);
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::nodesByProp(NodesByPropContext ctx)
  {
    auto p = ctx.getParams();
    auto nodes = store_.nodesByProp(p.getKey().cStr(), fromRpcValue(p.getVal()));
    auto out = ctx.getResults().initNodes(nodes.size());
    for (uint32_t i = 0; i < nodes.size(); ++i)
      toRpcNode(out[i], nodes[i]);
    return kj::READY_NOW;
  }

  // -------------------- traversal / query --------------------

  kj::Promise<void> QuasarImpl::traverse(TraverseContext ctx)
  {
    auto params = ctx.getParams().getParams();
    quasar::traverse::DfsOptions opts{};
    opts.direction = fromRpcDirection(params.getDirection());
    opts.maxDepth = params.getMaxDepth();

    quasar::traverse::Dfs dfs(store_, params.getStart().cStr(), opts);
    std::vector<quasar::traverse::Visit> visits;
    std::vector<std::vector<std::string>> paths;
    dfs.iterate([&](const quasar::traverse::Visit &v)
                {
                  visits.push_back(v);
                  paths.push_back(dfs.pathTo(v)); });

    auto out = ctx.getResults().initVisits(visits.size());
    for (uint32_t i = 0; i < visits.size(); ++i)
    {
      toRpcNode(out[i].initNode(), visits[i].node);
      out[i].setDepth(visits[i].depth);
      toRpcTextList(out[i].initPath(paths[i].size()), paths[i]);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::query(QueryContext ctx)
  {
    std::string text = ctx.getParams().getText().cStr();
    KJ_LOG(INFO, "query", text);
    auto rows = quasar::cypher::executeQuery(text, store_);

    auto out = ctx.getResults().initRows(rows.size());
    for (uint32_t i = 0; i < rows.size(); ++i)
    {
      auto bindings = out[i].initBindings(rows[i].size());
      uint32_t j = 0;
      for (const auto &[name, node] : rows[i])
      {
        bindings[j].setVariable(name);
        toRpcNode(bindings[j].initNode(), node);
        ++j;
      }
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> QuasarImpl::save(SaveContext ctx)
  {
    if (snapshotPath_.empty())
      throw quasar::InvalidInput("no snapshot path configured");
    auto stats = quasar::snapshot::saveToFile(store_, snapshotPath_);
    auto res = ctx.getResults();
    res.setNodes(stats.nodes);
    res.setEdges(stats.edges);
    return kj::READY_NOW;
  }

} // namespace quasar::rpc
