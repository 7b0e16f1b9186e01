#include "schemas/graph.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <iostream>
#include <string>

static void addPerson(quasar::rpc::Quasar::Client &cap, kj::WaitScope &ws, const char *id, const char *name)
{
  auto req = cap.addNodeRequest();
  auto params = req.initParams();
  params.setId(id);
  auto labels = params.initLabels(1);
  labels.set(0, "Person");
  auto props = params.initProps(1);
  props[0].setKey("name");
  props[0].initVal().setText(name);
  req.send().wait(ws);
}

static void printNode(quasar::rpc::Node::Reader n)
{
  std::cout << n.getId().cStr() << " {";
  auto props = n.getProps();
  for (uint32_t i = 0; i < props.size(); ++i)
  {
    if (i)
      std::cout << ", ";
    std::cout << props[i].getKey().cStr();
    if (props[i].getVal().isText())
      std::cout << ": " << props[i].getVal().getText().cStr();
  }
  std::cout << "}";
}

int main(int argc, char **argv)
{
  const char *addr = (argc > 1) ? argv[1] : "unix:/tmp/quasar.sock";
  capnp::EzRpcClient client(addr);
  auto &ws = client.getWaitScope();
  auto cap = client.getMain<quasar::rpc::Quasar>();

  addPerson(cap, ws, "alice", "Alice");
  addPerson(cap, ws, "bob", "Bob");
  addPerson(cap, ws, "carol", "Carol");
  std::cout << "nodes alice, bob, carol\n";

  // alice -> bob -> carol
  {
    auto add = cap.addEdgeRequest();
    add.setFrom("alice");
    add.setTo("bob");
    add.setWeight(1.0);
    add.send().wait(ws);
  }
  {
    auto add = cap.addEdgeRequest();
    add.setFrom("bob");
    add.setTo("carol");
    add.setWeight(2.5);
    add.send().wait(ws);
  }

  // depth-first walk from alice
  {
    auto req = cap.traverseRequest();
    auto p = req.initParams();
    p.setStart("alice");
    p.setDirection(quasar::rpc::Direction::OUT);
    auto resp = req.send().wait(ws);
    for (auto v : resp.getVisits())
    {
      std::cout << "visit depth=" << v.getDepth() << " path=";
      auto path = v.getPath();
      for (uint32_t i = 0; i < path.size(); ++i)
        std::cout << (i ? "->" : "") << path[i].cStr();
      std::cout << "\n";
    }
  }

  // everything reachable from alice
  {
    auto req = cap.queryRequest();
    req.setText("MATCH (a:Person {name: \"Alice\"})-[*]->(b) RETURN a, b");
    auto resp = req.send().wait(ws);
    for (auto row : resp.getRows())
    {
      std::cout << "row";
      for (auto b : row.getBindings())
      {
        std::cout << " " << b.getVariable().cStr() << "=";
        printNode(b.getNode());
      }
      std::cout << "\n";
    }
  }
}
