#include "store.hpp"
#include <algorithm>
#include <mutex>
#include <kj/debug.h>

namespace quasar
{
  // -------------------- adjacency helpers --------------------

  static std::string edge_name(std::string_view from, std::string_view to)
  {
    std::string s;
    s.reserve(from.size() + to.size() + 2);
    s.append(from);
    s.append("->");
    s.append(to);
    return s;
  }

  // The only place either index gains an entry. Both sides are written together.
  static void link_edge(AdjacencyIndex &out, AdjacencyIndex &in, const Edge &edge)
  {
    out[edge.from][edge.to] = edge;
    in[edge.to][edge.from] = edge;
  }

  // The only place either index loses an entry. Empty buckets are dropped so that
  // every remaining key names a node with at least one incident edge.
  static void unlink_edge(AdjacencyIndex &out, AdjacencyIndex &in, const std::string &from, const std::string &to)
  {
    auto oit = out.find(from);
    KJ_ASSERT(oit != out.end() && oit->second.count(to) == 1, "outgoing index missing edge", from, to);
    auto iit = in.find(to);
    KJ_ASSERT(iit != in.end() && iit->second.count(from) == 1, "incoming index missing edge", from, to);

    oit->second.erase(to);
    if (oit->second.empty())
      out.erase(oit);
    iit->second.erase(from);
    if (iit->second.empty())
      in.erase(iit);
  }

  static const Edge *find_edge(const AdjacencyIndex &out, const std::string &from, const std::string &to)
  {
    auto oit = out.find(from);
    if (oit == out.end())
      return nullptr;
    auto eit = oit->second.find(to);
    if (eit == oit->second.end())
      return nullptr;
    return &eit->second;
  }

  static std::vector<Edge> copy_bucket(const AdjacencyIndex &index, const std::string &id)
  {
    std::vector<Edge> edges;
    auto it = index.find(id);
    if (it == index.end())
      return edges;
    edges.reserve(it->second.size());
    for (const auto &[_, e] : it->second)
      edges.push_back(e);
    return edges;
  }

  static size_t bucket_size(const AdjacencyIndex &index, const std::string &id)
  {
    auto it = index.find(id);
    return it == index.end() ? 0 : it->second.size();
  }

  // -------------------- api ---------------------------

  const Node &Store::requireNode(const std::string &id) const
  {
    auto it = nodes_.find(id);
    if (it == nodes_.end())
      throw NotFound("node not found: " + id);
    return it->second;
  }

  void Store::addNode(const AddNodeParams &params)
  {
    if (params.id.empty())
      throw InvalidInput("empty node id");

    std::unique_lock lock(mu_);
    if (nodes_.count(params.id))
      throw AlreadyExists("node already exists: " + params.id);

    Node node{};
    node.id = params.id;
    node.labels = params.labels;
    node.properties = params.properties;
    nodes_.emplace(params.id, std::move(node));
  }

  void Store::addNode(const std::string &id, const Properties &properties)
  {
    addNode(AddNodeParams{.id = id, .labels = {}, .properties = properties});
  }

  void Store::removeNode(const std::string &id)
  {
    std::unique_lock lock(mu_);
    if (!nodes_.count(id))
      throw NotFound("node not found: " + id);

    // outgoing edges, then incoming edges, then the node itself
    for (const auto &e : copy_bucket(out_, id))
      unlink_edge(out_, in_, e.from, e.to);
    for (const auto &e : copy_bucket(in_, id))
      unlink_edge(out_, in_, e.from, e.to);

    KJ_ASSERT(!out_.count(id) && !in_.count(id), "dangling adjacency after node removal", id);
    nodes_.erase(id);
  }

  void Store::upsertNodeProps(const UpsertNodePropsParams &params)
  {
    std::unique_lock lock(mu_);
    auto it = nodes_.find(params.id);
    if (it == nodes_.end())
      throw NotFound("node not found: " + params.id);

    auto &props = it->second.properties;
    for (const auto &key : params.unsetKeys)
      props.erase(key);
    for (const auto &[key, val] : params.set)
      props[key] = val;
  }

  void Store::setNodeLabels(const SetNodeLabelsParams &params)
  {
    std::unique_lock lock(mu_);
    auto it = nodes_.find(params.id);
    if (it == nodes_.end())
      throw NotFound("node not found: " + params.id);
    for (const auto &label : params.addLabels)
      if (label.empty())
        throw InvalidInput("empty label");

    auto &labels = it->second.labels;
    for (const auto &label : params.removeLabels)
      labels.erase(label);
    for (const auto &label : params.addLabels)
      labels.insert(label);
  }

  void Store::addEdge(const std::string &from, const std::string &to, double weight)
  {
    if (from.empty() || to.empty())
      throw InvalidInput("empty edge endpoint");

    std::unique_lock lock(mu_);
    requireNode(from);
    requireNode(to);
    if (find_edge(out_, from, to) != nullptr)
      throw AlreadyExists("edge already exists: " + edge_name(from, to));

    link_edge(out_, in_, Edge{from, to, weight});
  }

  void Store::updateEdge(const std::string &from, const std::string &to, double weight)
  {
    std::unique_lock lock(mu_);
    if (find_edge(out_, from, to) == nullptr)
      throw NotFound("edge not found: " + edge_name(from, to));

    // rewrite both index entries so they keep describing the same edge
    link_edge(out_, in_, Edge{from, to, weight});
  }

  void Store::removeEdge(const std::string &from, const std::string &to)
  {
    std::unique_lock lock(mu_);
    if (find_edge(out_, from, to) == nullptr)
      throw NotFound("edge not found: " + edge_name(from, to));
    unlink_edge(out_, in_, from, to);
  }

  Node Store::getNode(const std::string &id) const
  {
    std::shared_lock lock(mu_);
    return requireNode(id);
  }

  bool Store::hasNode(const std::string &id) const
  {
    std::shared_lock lock(mu_);
    return nodes_.count(id) == 1;
  }

  std::vector<Node> Store::allNodes() const
  {
    std::shared_lock lock(mu_);
    std::vector<Node> out;
    out.reserve(nodes_.size());
    for (const auto &[_, node] : nodes_)
      out.push_back(node);
    return out;
  }

  size_t Store::nodeCount() const
  {
    std::shared_lock lock(mu_);
    return nodes_.size();
  }

  std::vector<Edge> Store::getOutEdges(const std::string &id) const
  {
    std::shared_lock lock(mu_);
    requireNode(id);
    return copy_bucket(out_, id);
  }

  std::vector<Edge> Store::getInEdges(const std::string &id) const
  {
    std::shared_lock lock(mu_);
    requireNode(id);
    return copy_bucket(in_, id);
  }

  Edge Store::getEdge(const std::string &from, const std::string &to) const
  {
    std::shared_lock lock(mu_);
    const Edge *e = find_edge(out_, from, to);
    if (e == nullptr)
      throw NotFound("edge not found: " + edge_name(from, to));
    return *e;
  }

  std::vector<Node> Store::nodesByProp(const std::string &key, const Value &value) const
  {
    std::shared_lock lock(mu_);
    std::vector<Node> out;
    for (const auto &[_, node] : nodes_)
    {
      auto it = node.properties.find(key);
      if (it != node.properties.end() && it->second == value)
        out.push_back(node);
    }
    return out;
  }

  std::vector<std::string> Store::scanNodesByLabel(const std::string &label, uint32_t limit) const
  {
    std::vector<std::string> ids;
    {
      std::shared_lock lock(mu_);
      for (const auto &[id, node] : nodes_)
        if (node.labels.count(label))
          ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    if (limit != 0 && ids.size() > limit)
      ids.resize(limit);
    return ids;
  }

  uint64_t Store::degree(const std::string &id, Direction direction) const
  {
    std::shared_lock lock(mu_);
    requireNode(id);
    switch (direction)
    {
    case Direction::Out:
      return bucket_size(out_, id);
    case Direction::In:
      return bucket_size(in_, id);
    case Direction::Both:
      return bucket_size(out_, id) + bucket_size(in_, id);
    }
    return 0;
  }

  GraphDump Store::dump() const
  {
    std::shared_lock lock(mu_);
    GraphDump d{};
    d.nodes.reserve(nodes_.size());
    for (const auto &[_, node] : nodes_)
      d.nodes.push_back(node);
    for (const auto &[from, bucket] : out_)
      for (const auto &[to, e] : bucket)
        d.edges.push_back(e);
    return d;
  }

  void Store::replace(const GraphDump &dump)
  {
    // build and validate the new tables before touching the live ones
    std::unordered_map<std::string, Node> nodes;
    nodes.reserve(dump.nodes.size());
    for (const auto &n : dump.nodes)
    {
      if (n.id.empty())
        throw InvalidInput("empty node id");
      if (!nodes.emplace(n.id, n).second)
        throw AlreadyExists("duplicate node id: " + n.id);
    }

    AdjacencyIndex out, in;
    for (const auto &e : dump.edges)
    {
      if (!nodes.count(e.from))
        throw NotFound("edge references missing node: " + e.from);
      if (!nodes.count(e.to))
        throw NotFound("edge references missing node: " + e.to);
      if (find_edge(out, e.from, e.to) != nullptr)
        throw AlreadyExists("duplicate edge: " + edge_name(e.from, e.to));
      link_edge(out, in, e);
    }

    std::unique_lock lock(mu_);
    nodes_.swap(nodes);
    out_.swap(out);
    in_.swap(in);
  }

} // namespace quasar
