#pragma once
#include "errors.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace quasar
{

  using Value = std::variant<int64_t, double, bool, uint64_t, std::string, std::monostate>;
  using Properties = std::map<std::string, Value>;
  using LabelSet = std::set<std::string>;

  // -------------------- node / edge data ---------------------------

  struct Node
  {
    std::string id{};
    LabelSet labels{};
    Properties properties{};

    bool operator==(const Node &) const = default;
  };

  struct Edge
  {
    std::string from{};
    std::string to{};
    double weight{0.0};

    bool operator==(const Edge &) const = default;
  };

  enum class Direction : uint8_t
  {
    Out = 0,
    In = 1,
    Both = 2
  };

  // -------------------- params / results ---------------------------

  struct AddNodeParams
  {
    std::string id{};
    LabelSet labels{};
    Properties properties{};
  };

  struct UpsertNodePropsParams
  {
    std::string id{};
    Properties set{};
    std::vector<std::string> unsetKeys{};
  };

  struct SetNodeLabelsParams
  {
    std::string id{};
    std::vector<std::string> addLabels{};
    std::vector<std::string> removeLabels{};
  };

  using AdjacencyIndex = std::unordered_map<std::string, std::unordered_map<std::string, Edge>>;

  // full copy of the store taken under a single shared lock
  struct GraphDump
  {
    std::vector<Node> nodes;
    std::vector<Edge> edges;
  };

  class Store
  {
  public:
    Store() = default;
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    // writes
    void addNode(const AddNodeParams &params);
    void addNode(const std::string &id, const Properties &properties);
    void removeNode(const std::string &id);
    void upsertNodeProps(const UpsertNodePropsParams &params);
    void setNodeLabels(const SetNodeLabelsParams &params);
    void addEdge(const std::string &from, const std::string &to, double weight);
    void updateEdge(const std::string &from, const std::string &to, double weight);
    void removeEdge(const std::string &from, const std::string &to);

    // reads / queries; every result is an independent copy
    Node getNode(const std::string &id) const;
    bool hasNode(const std::string &id) const;
    std::vector<Node> allNodes() const;
    size_t nodeCount() const;
    std::vector<Edge> getOutEdges(const std::string &id) const;
    std::vector<Edge> getInEdges(const std::string &id) const;
    Edge getEdge(const std::string &from, const std::string &to) const;
    std::vector<Node> nodesByProp(const std::string &key, const Value &value) const;
    std::vector<std::string> scanNodesByLabel(const std::string &label, uint32_t limit) const;
    uint64_t degree(const std::string &id, Direction direction) const;

    // bulk
    GraphDump dump() const;
    void replace(const GraphDump &dump);

  private:
    const Node &requireNode(const std::string &id) const;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Node> nodes_;
    AdjacencyIndex out_; // from -> to -> edge
    AdjacencyIndex in_;  // to -> from -> edge
  };

} // namespace quasar
