#include "store.hpp"
#include "traverse.hpp"
#include <gtest/gtest.h>
#include <map>
#include <set>
#include <stdexcept>

using quasar::traverse::Dfs;
using quasar::traverse::DfsOptions;
using quasar::traverse::RangeFilter;
using quasar::traverse::Visit;

namespace
{

  void addChain(quasar::Store &store, const std::vector<std::string> &ids)
  {
    for (const auto &id : ids)
      store.addNode(id, {});
    for (size_t i = 0; i + 1 < ids.size(); ++i)
      store.addEdge(ids[i], ids[i + 1], 1.0);
  }

  std::vector<Visit> collect(Dfs &dfs)
  {
    std::vector<Visit> out;
    dfs.iterate([&](const Visit &v)
                { out.push_back(v); });
    return out;
  }

  std::vector<std::string> ids(const std::vector<Visit> &visits)
  {
    std::vector<std::string> out;
    for (const auto &v : visits)
      out.push_back(v.node.id);
    return out;
  }

  quasar::traverse::NodePredicate idIs(const std::string &id)
  {
    return [id](const quasar::Node &n)
    { return n.id == id; };
  }

} // namespace

TEST(Traverse, ChainVisitsInOrderWithDepths)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C", "D"});

  Dfs dfs(store, "A");
  auto visits = collect(dfs);
  EXPECT_EQ(ids(visits), (std::vector<std::string>{"A", "B", "C", "D"}));
  for (size_t i = 0; i < visits.size(); ++i)
    EXPECT_EQ(visits[i].depth, int(i));
  EXPECT_FALSE(dfs.hasNext());
  EXPECT_EQ(dfs.depth(), -1);
}

TEST(Traverse, MissingStartFailsNotFound)
{
  quasar::Store store;
  EXPECT_THROW(Dfs(store, "ghost"), quasar::NotFound);
}

TEST(Traverse, MaxDepthBoundsTree)
{
  // A -> B -> D, A -> C -> E -> F
  quasar::Store store;
  for (auto id : {"A", "B", "C", "D", "E", "F"})
    store.addNode(id, {});
  store.addEdge("A", "B", 1);
  store.addEdge("A", "C", 1);
  store.addEdge("B", "D", 1);
  store.addEdge("C", "E", 1);
  store.addEdge("E", "F", 1);

  std::map<int, std::set<std::string>> want{
      {0, {"A"}},
      {1, {"A", "B", "C"}},
      {2, {"A", "B", "C", "D", "E"}},
      {3, {"A", "B", "C", "D", "E", "F"}},
  };
  for (const auto &[k, expected] : want)
  {
    DfsOptions opts{};
    opts.maxDepth = k;
    Dfs dfs(store, "A", opts);
    auto visits = collect(dfs);

    std::set<std::string> got;
    for (const auto &v : visits)
    {
      EXPECT_TRUE(got.insert(v.node.id).second) << "visited twice: " << v.node.id;
      EXPECT_LE(v.depth, k);
    }
    EXPECT_EQ(got, expected) << "maxDepth " << k;
  }
}

TEST(Traverse, CycleYieldsEachNodeOnce)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C"});
  store.addEdge("C", "A", 1);

  Dfs dfs(store, "A");
  EXPECT_EQ(ids(collect(dfs)), (std::vector<std::string>{"A", "B", "C"}));
}

TEST(Traverse, InAndBothDirections)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C"});
  store.addNode("X", {});
  store.addEdge("X", "B", 1);

  DfsOptions in{};
  in.direction = quasar::Direction::In;
  Dfs up(store, "C", in);
  auto upIds = ids(collect(up));
  EXPECT_EQ(std::set<std::string>(upIds.begin(), upIds.end()), (std::set<std::string>{"C", "B", "A", "X"}));
  EXPECT_EQ(upIds.size(), 4u);

  DfsOptions both{};
  both.direction = quasar::Direction::Both;
  both.maxDepth = 1;
  Dfs around(store, "B", both);
  auto aroundIds = ids(collect(around));
  EXPECT_EQ(std::set<std::string>(aroundIds.begin(), aroundIds.end()), (std::set<std::string>{"A", "B", "C", "X"}));

  Dfs forward(store, "X");
  EXPECT_EQ(ids(collect(forward)), (std::vector<std::string>{"X", "B", "C"}));
}

TEST(Traverse, PathToFollowsParents)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C", "D"});

  Dfs dfs(store, "A");
  std::vector<std::vector<std::string>> paths;
  dfs.iterate([&](const Visit &v)
              { paths.push_back(dfs.pathTo(v)); });

  ASSERT_EQ(paths.size(), 4u);
  EXPECT_EQ(paths[0], (std::vector<std::string>{"A"}));
  EXPECT_EQ(paths[3], (std::vector<std::string>{"A", "B", "C", "D"}));

  Visit foreign{};
  foreign.pathIndex = 99;
  EXPECT_THROW(dfs.pathTo(foreign), quasar::InvalidInput);
}

TEST(Traverse, NextAndDepthStepByStep)
{
  quasar::Store store;
  addChain(store, {"A", "B"});

  Dfs dfs(store, "A");
  EXPECT_EQ(dfs.depth(), 0);
  auto first = dfs.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->node.id, "A");
  EXPECT_EQ(dfs.depth(), 1);
  auto second = dfs.next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->node.id, "B");
  EXPECT_FALSE(dfs.next().has_value());
}

TEST(Traverse, RangeFilterYieldsWindowInclusive)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C", "D", "E"});

  DfsOptions opts{};
  opts.rangeFilter = RangeFilter{idIs("B"), idIs("D")};
  Dfs dfs(store, "A", opts);
  EXPECT_EQ(ids(collect(dfs)), (std::vector<std::string>{"B", "C", "D"}));
}

TEST(Traverse, RangeFilterNeedsBothPredicates)
{
  quasar::Store store;
  store.addNode("A", {});
  DfsOptions opts{};
  opts.rangeFilter = RangeFilter{idIs("A"), nullptr};
  EXPECT_THROW(Dfs(store, "A", opts), quasar::InvalidInput);
}

TEST(Traverse, VisitorExceptionStopsWalk)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C"});

  Dfs dfs(store, "A");
  int seen = 0;
  EXPECT_THROW(dfs.iterate([&](const Visit &)
                           {
                             if (++seen == 2)
                               throw std::runtime_error("stop"); }),
               std::runtime_error);
  EXPECT_EQ(seen, 2);
  EXPECT_FALSE(dfs.hasNext());
}

TEST(Traverse, NodeRemovedMidWalkIsSkipped)
{
  quasar::Store store;
  addChain(store, {"A", "B", "C"});

  Dfs dfs(store, "A");
  auto first = dfs.next();
  ASSERT_TRUE(first.has_value());
  // B is already on the frontier
  store.removeNode("B");
  EXPECT_FALSE(dfs.next().has_value());
}
