#pragma once
#include "store.hpp"
#include <functional>
#include <optional>
#include <unordered_set>

namespace quasar::traverse
{

  using NodePredicate = std::function<bool(const Node &)>;

  // A window over a branch: entered on the first node matching `start`, left
  // after the node matching `end` has been yielded.
  struct RangeFilter
  {
    NodePredicate start{};
    NodePredicate end{};
  };

  struct DfsOptions
  {
    Direction direction{Direction::Out};
    int maxDepth{-1}; // -1 = unbounded
    std::optional<RangeFilter> rangeFilter{};
  };

  struct Visit
  {
    Node node{};
    int depth{0};
    size_t pathIndex{0};
  };

  class Iterator
  {
  public:
    virtual ~Iterator() = default;

    virtual bool hasNext() const = 0;
    virtual std::optional<Visit> next() = 0;

    // Calls visitor for every remaining visit. An exception thrown by the
    // visitor ends the walk and the unvisited frontier is dropped.
    void iterate(const std::function<void(const Visit &)> &visitor);

  protected:
    virtual void discard() = 0;
  };

  class Dfs final : public Iterator
  {
  public:
    Dfs(const Store &store, const std::string &startId, DfsOptions options = {});

    bool hasNext() const override;
    std::optional<Visit> next() override;

    // depth of the entry that will be popped next, -1 when exhausted
    int depth() const;

    // node ids from the start node to the visited node, both inclusive
    std::vector<std::string> pathTo(const Visit &visit) const;

  protected:
    void discard() override;

  private:
    static constexpr int64_t NoParent = -1;

    struct Frame
    {
      std::string id;
      int depth;
      int64_t parent; // index into path_ of the node that pushed this frame
    };

    struct PathNode
    {
      std::string id;
      int64_t parent;
      int depth;
    };

    std::vector<std::string> neighbours(const std::string &id) const;

    const Store &store_;
    DfsOptions options_;
    std::vector<Frame> stack_;
    std::vector<PathNode> path_;
    std::unordered_set<std::string> visited_;
    bool inRange_{false};
  };

} // namespace quasar::traverse
