#pragma once
#include "store.hpp"
#include <string>

namespace quasar::http
{

  // Starts a Mongoose HTTP server in a background thread.
  // Endpoints (all replies are JSON):
  // - GET    /api/health -> { "ok": true }
  // - POST   /api/node?id=A&labels=L1,L2&props=k=v,k2=v2
  // - GET    /api/node?id=A -> { "node": {...} }
  // - DELETE /api/node?id=A
  // - POST   /api/nodeProps?id=A&set=k=v&unset=k2,k3
  // - POST   /api/nodeLabels?id=A&add=L1&remove=L2
  // - POST   /api/edge?from=A&to=B&weight=1.5
  // - PUT    /api/edge?from=A&to=B&weight=2
  // - GET    /api/edge?from=A&to=B -> { "edge": {...} }
  // - DELETE /api/edge?from=A&to=B
  // - GET    /api/edges?id=A&direction=out|in|both -> { "edges": [...] }
  // - GET    /api/degree?id=A&direction=out|in|both -> { "count": n }
  // - GET    /api/scanNodesByLabel?label=L&limit=n -> { "ids": [...] }
  // - POST   /api/query (body = query text) -> { "rows": [ { "var": {...} } ] }
  // - POST   /api/save -> { "nodes": n, "edges": m }
  // bind must be like "http://0.0.0.0:8080" or "http://127.0.0.1:0" (0 means ephemeral)
  // snapshotPath is the target of /api/save; empty disables it
  void startHttpServer(quasar::Store &store, const std::string &bind, const std::string &snapshotPath);

} // namespace quasar::http
