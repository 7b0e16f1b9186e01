#pragma once
#include "store.hpp"
#include "schemas/graph.capnp.h"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <string>

namespace quasar::rpc
{

  class QuasarImpl final : public Quasar::Server
  {
  public:
    // snapshotPath is the target of save(); empty disables it
    QuasarImpl(quasar::Store &s, std::string snapshotPath);

    kj::Promise<void> addNode(AddNodeContext ctx) override;
    kj::Promise<void> removeNode(RemoveNodeContext ctx) override;
    kj::Promise<void> upsertNodeProps(UpsertNodePropsContext ctx) override;
    kj::Promise<void> setNodeLabels(SetNodeLabelsContext ctx) override;

    kj::Promise<void> addEdge(AddEdgeContext ctx) override;
    kj::Promise<void> updateEdge(UpdateEdgeContext ctx) override;
    kj::Promise<void> removeEdge(RemoveEdgeContext ctx) override;

    kj::Promise<void> getNode(GetNodeContext ctx) override;
    kj::Promise<void> getEdge(GetEdgeContext ctx) override;
    kj::Promise<void> listEdges(ListEdgesContext ctx) override;
    kj::Promise<void> scanNodesByLabel(ScanNodesByLabelContext ctx) override;
    kj::Promise<void> degree(DegreeContext ctx) override;
    kj::Promise<void> nodesByProp(NodesByPropContext ctx) override;

    kj::Promise<void> traverse(TraverseContext ctx) override;
    kj::Promise<void> query(QueryContext ctx) override;
    kj::Promise<void> save(SaveContext ctx) override;

  private:
    quasar::Store &store_;
    std::string snapshotPath_;
  };

} // namespace quasar::rpc
