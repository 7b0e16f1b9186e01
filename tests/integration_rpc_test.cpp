#include "schemas/graph.capnp.h"
#include "server.hpp"
#include "store.hpp"
#include <capnp/ez-rpc.h>
#include <gtest/gtest.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <filesystem>
#include <thread>
#include <chrono>
#include <cstring>
#include <set>
#include <unistd.h>

namespace
{

  std::string uniqueTempPath(const std::string &stem, const std::string &ext = "")
  {
    auto base = std::filesystem::temp_directory_path() / (stem + std::to_string(::getpid()) + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    auto s = base.string() + ext;
    return s;
  }

  struct RpcServerThread
  {
    std::string snapshotPath;
    std::string bind;
    std::thread th;

    explicit RpcServerThread(std::string snapshotPath_, std::string bind_)
        : snapshotPath(std::move(snapshotPath_)), bind(std::move(bind_))
    {
      th = std::thread([this]()
                       {
      try {
        kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);

        quasar::Store store;

        const char* bindC = bind.c_str();
        if (std::strncmp(bindC, "unix:", 5) == 0) {
          const char* path = bindC + 5;
          ::unlink(path);
        }

        capnp::EzRpcServer server(kj::heap<quasar::rpc::QuasarImpl>(store, snapshotPath), bindC);
        auto& waitScope = server.getWaitScope();
        kj::NEVER_DONE.wait(waitScope);
      } catch (const std::exception& e) {
        KJ_LOG(ERROR, "RpcServerThread failed", e.what());
      } catch (const kj::Exception& e) {
        KJ_LOG(ERROR, "RpcServerThread failed", e.getDescription());
      } });
      th.detach();
    }
  };

  void waitForUnixSocketReady(const std::string &path, int maxMs = 2000)
  {
    using namespace std::chrono_literals;
    for (int i = 0; i < maxMs / 10; ++i)
    {
      if (std::filesystem::exists(path))
        return;
      std::this_thread::sleep_for(10ms);
    }
  }

} // namespace

class IntegrationRpc : public ::testing::Test
{
protected:
  static std::string snapshotPath;
  static std::string sockPath;
  static std::string bind;
  static std::unique_ptr<RpcServerThread> server;
  static std::unique_ptr<capnp::EzRpcClient> client;

  static void SetUpTestSuite()
  {
    snapshotPath = uniqueTempPath("quasar-test-snapshot-", ".json");
    sockPath = uniqueTempPath("quasar-test-sock-", ".sock");
    bind = std::string("unix:") + sockPath;
    server = std::make_unique<RpcServerThread>(snapshotPath, bind);
    waitForUnixSocketReady(sockPath);
    client = std::make_unique<capnp::EzRpcClient>(bind.c_str());
  }

  static void TearDownTestSuite()
  {
    client.reset();
    server.reset();
    std::filesystem::remove(snapshotPath);
  }

  static quasar::rpc::Quasar::Client cap()
  {
    return client->getMain<quasar::rpc::Quasar>();
  }

  static void addNode(const char *id, const char *label)
  {
    auto req = cap().addNodeRequest();
    auto p = req.initParams();
    p.setId(id);
    if (label != nullptr)
    {
      auto labels = p.initLabels(1);
      labels.set(0, label);
    }
    req.send().wait(client->getWaitScope());
  }

  static void addEdge(const char *from, const char *to, double weight)
  {
    auto req = cap().addEdgeRequest();
    req.setFrom(from);
    req.setTo(to);
    req.setWeight(weight);
    req.send().wait(client->getWaitScope());
  }
};

std::string IntegrationRpc::snapshotPath;
std::string IntegrationRpc::sockPath;
std::string IntegrationRpc::bind;
std::unique_ptr<RpcServerThread> IntegrationRpc::server;
std::unique_ptr<capnp::EzRpcClient> IntegrationRpc::client;

TEST_F(IntegrationRpc, Step01_AddNodeA)
{
  auto &ws = client->getWaitScope();

  auto req = cap().addNodeRequest();
  auto p = req.initParams();
  p.setId("A");
  auto labels = p.initLabels(2);
  labels.set(0, "Person");
  labels.set(1, "Admin");

  auto props = p.initProps(2);
  {
    auto pr = props[0];
    pr.setKey("k");
    pr.initVal().setText("v");
  }
  {
    auto pr = props[1];
    pr.setKey("age");
    pr.initVal().setI64(42);
  }
  req.send().wait(ws);

  auto get = cap().getNodeRequest();
  get.setId("A");
  auto node = get.send().wait(ws).getNode();
  EXPECT_EQ(std::string(node.getId().cStr()), "A");
  EXPECT_EQ(node.getLabels().size(), 2u);
  ASSERT_EQ(node.getProps().size(), 2u);
  // properties come back in key order
  EXPECT_EQ(std::string(node.getProps()[0].getKey().cStr()), "age");
  EXPECT_EQ(node.getProps()[0].getVal().getI64(), 42);
  EXPECT_EQ(std::string(node.getProps()[1].getVal().getText().cStr()), "v");
}

TEST_F(IntegrationRpc, Step02_DuplicateNodeFails)
{
  auto &ws = client->getWaitScope();
  auto req = cap().addNodeRequest();
  req.initParams().setId("A");
  EXPECT_THROW(req.send().wait(ws), kj::Exception);
}

TEST_F(IntegrationRpc, Step03_BuildChain)
{
  addNode("B", "Person");
  addNode("C", nullptr);
  addNode("D", nullptr);
  addEdge("A", "B", 1.0);
  addEdge("B", "C", 2.0);
  addEdge("C", "D", 3.0);

  auto &ws = client->getWaitScope();
  auto req = cap().listEdgesRequest();
  req.setId("B");
  req.setDirection(quasar::rpc::Direction::BOTH);
  auto edges = req.send().wait(ws).getEdges();
  ASSERT_EQ(edges.size(), 2u);

  std::set<std::string> ends;
  for (auto e : edges)
    ends.insert(std::string(e.getFrom().cStr()) + "->" + e.getTo().cStr());
  EXPECT_EQ(ends, (std::set<std::string>{"A->B", "B->C"}));
}

TEST_F(IntegrationRpc, Step04_EdgeToMissingNodeFails)
{
  EXPECT_THROW(addEdge("A", "ghost", 1.0), kj::Exception);
}

TEST_F(IntegrationRpc, Step05_UpdateAndGetEdge)
{
  auto &ws = client->getWaitScope();
  {
    auto req = cap().updateEdgeRequest();
    req.setFrom("B");
    req.setTo("C");
    req.setWeight(9.5);
    req.send().wait(ws);
  }
  auto get = cap().getEdgeRequest();
  get.setFrom("B");
  get.setTo("C");
  EXPECT_DOUBLE_EQ(get.send().wait(ws).getEdge().getWeight(), 9.5);
}

TEST_F(IntegrationRpc, Step06_UpsertPropsAndLabels)
{
  auto &ws = client->getWaitScope();
  {
    auto req = cap().upsertNodePropsRequest();
    auto p = req.initParams();
    p.setId("B");
    auto set = p.initSet(1);
    set[0].setKey("score");
    set[0].initVal().setF64(0.75);
    req.send().wait(ws);
  }
  {
    auto req = cap().setNodeLabelsRequest();
    auto p = req.initParams();
    p.setId("C");
    auto add = p.initAddLabels(1);
    add.set(0, "Person");
    req.send().wait(ws);
  }

  auto scan = cap().scanNodesByLabelRequest();
  scan.setLabel("Person");
  auto ids = scan.send().wait(ws).getIds();
  ASSERT_EQ(ids.size(), 3u);
  EXPECT_EQ(std::string(ids[0].cStr()), "A");
  EXPECT_EQ(std::string(ids[2].cStr()), "C");

  auto byProp = cap().nodesByPropRequest();
  byProp.setKey("score");
  byProp.initVal().setF64(0.75);
  auto nodes = byProp.send().wait(ws).getNodes();
  ASSERT_EQ(nodes.size(), 1u);
  EXPECT_EQ(std::string(nodes[0].getId().cStr()), "B");
}

TEST_F(IntegrationRpc, Step07_Degree)
{
  auto &ws = client->getWaitScope();
  auto req = cap().degreeRequest();
  req.setId("B");
  req.setDirection(quasar::rpc::Direction::BOTH);
  EXPECT_EQ(req.send().wait(ws).getCount(), 2u);
}

TEST_F(IntegrationRpc, Step08_TraverseWithPaths)
{
  auto &ws = client->getWaitScope();
  auto req = cap().traverseRequest();
  auto p = req.initParams();
  p.setStart("A");
  p.setDirection(quasar::rpc::Direction::OUT);
  p.setMaxDepth(2);

  auto visits = req.send().wait(ws).getVisits();
  ASSERT_EQ(visits.size(), 3u);
  EXPECT_EQ(std::string(visits[2].getNode().getId().cStr()), "C");
  EXPECT_EQ(visits[2].getDepth(), 2);
  auto path = visits[2].getPath();
  ASSERT_EQ(path.size(), 3u);
  EXPECT_EQ(std::string(path[0].cStr()), "A");
  EXPECT_EQ(std::string(path[1].cStr()), "B");
}

TEST_F(IntegrationRpc, Step09_Query)
{
  auto &ws = client->getWaitScope();
  auto req = cap().queryRequest();
  req.setText("MATCH (a {k: 'v'})-[*1..3]->(b) RETURN a, b ORDER BY b");
  auto rows = req.send().wait(ws).getRows();
  ASSERT_EQ(rows.size(), 3u);

  std::vector<std::string> bs;
  for (auto row : rows)
  {
    ASSERT_EQ(row.getBindings().size(), 2u);
    for (auto b : row.getBindings())
    {
      if (std::string(b.getVariable().cStr()) == "a")
        EXPECT_EQ(std::string(b.getNode().getId().cStr()), "A");
      else
        bs.push_back(b.getNode().getId().cStr());
    }
  }
  EXPECT_EQ(bs, (std::vector<std::string>{"B", "C", "D"}));
}

TEST_F(IntegrationRpc, Step10_BadQueryFails)
{
  auto &ws = client->getWaitScope();
  auto req = cap().queryRequest();
  req.setText("MATCH (a RETURN a");
  EXPECT_THROW(req.send().wait(ws), kj::Exception);
}

TEST_F(IntegrationRpc, Step11_Save)
{
  auto &ws = client->getWaitScope();
  auto resp = cap().saveRequest().send().wait(ws);
  EXPECT_EQ(resp.getNodes(), 4u);
  EXPECT_EQ(resp.getEdges(), 3u);
  EXPECT_TRUE(std::filesystem::exists(snapshotPath));
}

TEST_F(IntegrationRpc, Step12_RemoveNodeCascades)
{
  auto &ws = client->getWaitScope();
  {
    auto req = cap().removeNodeRequest();
    req.setId("B");
    req.send().wait(ws);
  }
  {
    auto req = cap().listEdgesRequest();
    req.setId("A");
    req.setDirection(quasar::rpc::Direction::OUT);
    EXPECT_EQ(req.send().wait(ws).getEdges().size(), 0u);
  }
  {
    auto req = cap().listEdgesRequest();
    req.setId("C");
    req.setDirection(quasar::rpc::Direction::IN);
    EXPECT_EQ(req.send().wait(ws).getEdges().size(), 0u);
  }
  {
    auto req = cap().removeEdgeRequest();
    req.setFrom("A");
    req.setTo("B");
    EXPECT_THROW(req.send().wait(ws), kj::Exception);
  }
}
