#include "traverse.hpp"
#include <algorithm>
#include <kj/common.h>
#include <kj/debug.h>

namespace quasar::traverse
{

  void Iterator::iterate(const std::function<void(const Visit &)> &visitor)
  {
    KJ_DEFER(discard());
    while (hasNext())
    {
      auto v = next();
      if (!v)
        break;
      visitor(*v);
    }
  }

  Dfs::Dfs(const Store &store, const std::string &startId, DfsOptions options)
      : store_(store), options_(std::move(options))
  {
    if (!store_.hasNode(startId))
      throw NotFound("start node not found: " + startId);
    if (options_.rangeFilter)
    {
      if (!options_.rangeFilter->start || !options_.rangeFilter->end)
        throw InvalidInput("range filter needs both a start and an end predicate");
    }
    stack_.push_back(Frame{startId, 0, NoParent});
  }

  bool Dfs::hasNext() const
  {
    return !stack_.empty();
  }

  int Dfs::depth() const
  {
    if (stack_.empty())
      return -1;
    return stack_.back().depth;
  }

  void Dfs::discard()
  {
    stack_.clear();
  }

  std::vector<std::string> Dfs::neighbours(const std::string &id) const
  {
    std::vector<std::string> ids;
    // the node may have been removed since it was pushed
    try
    {
      if (options_.direction == Direction::Out || options_.direction == Direction::Both)
        for (const auto &e : store_.getOutEdges(id))
          ids.push_back(e.to);
      if (options_.direction == Direction::In || options_.direction == Direction::Both)
        for (const auto &e : store_.getInEdges(id))
          ids.push_back(e.from);
    }
    catch (const NotFound &)
    {
      ids.clear();
    }
    return ids;
  }

  std::optional<Visit> Dfs::next()
  {
    while (!stack_.empty())
    {
      Frame frame = std::move(stack_.back());
      stack_.pop_back();

      if (visited_.count(frame.id))
        continue;

      Node node{};
      try
      {
        node = store_.getNode(frame.id);
      }
      catch (const NotFound &)
      {
        continue;
      }
      visited_.insert(frame.id);

      size_t pathIndex = path_.size();
      path_.push_back(PathNode{frame.id, frame.parent, frame.depth});

      bool endsRange = false;
      if (options_.rangeFilter)
      {
        const auto &rf = *options_.rangeFilter;
        if (!inRange_ && rf.start(node))
          inRange_ = true;
        if (rf.end(node))
        {
          endsRange = true;
          if (inRange_)
            inRange_ = false;
        }
      }

      if (options_.maxDepth < 0 || frame.depth < options_.maxDepth)
      {
        auto ids = neighbours(frame.id);
        for (auto it = ids.rbegin(); it != ids.rend(); ++it)
        {
          if (!visited_.count(*it))
            stack_.push_back(Frame{*it, frame.depth + 1, static_cast<int64_t>(pathIndex)});
        }
      }

      // a node closing the window is still part of it
      if (!options_.rangeFilter || inRange_ || endsRange)
        return Visit{std::move(node), frame.depth, pathIndex};
    }
    return std::nullopt;
  }

  std::vector<std::string> Dfs::pathTo(const Visit &visit) const
  {
    if (visit.pathIndex >= path_.size())
      throw InvalidInput("visit does not belong to this traversal");

    std::vector<std::string> ids;
    int64_t i = static_cast<int64_t>(visit.pathIndex);
    while (i != NoParent)
    {
      const auto &p = path_[static_cast<size_t>(i)];
      KJ_ASSERT(p.parent < i, "path arena parent must precede child", p.id);
      ids.push_back(p.id);
      i = p.parent;
    }
    std::reverse(ids.begin(), ids.end());
    return ids;
  }

} // namespace quasar::traverse
