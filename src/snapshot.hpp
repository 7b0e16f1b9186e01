#pragma once
#include "store.hpp"
#include <string>
#include <string_view>

namespace quasar::snapshot
{

  // malformed document or unreadable / unwritable file
  struct SnapshotError : GraphError
  {
    explicit SnapshotError(const std::string &what) : GraphError(ErrorCode::Snapshot, "snapshot: " + what) {}
  };

  // Nodes are written sorted by id, edges by (from, to) and property keys in
  // order, so serializing a loaded document reproduces it byte for byte.
  std::string toJson(const GraphDump &dump);
  std::string toJson(const Store &store);

  // Syntax and type checks only; referential checks happen in Store::replace.
  GraphDump parseJson(std::string_view json);

  // Replaces the contents of the store. Nothing changes unless the whole
  // document is valid.
  void fromJson(Store &store, std::string_view json);

  struct SnapshotStats
  {
    uint64_t nodes{0};
    uint64_t edges{0};
  };

  SnapshotStats saveToFile(const Store &store, const std::string &path);
  SnapshotStats loadFromFile(Store &store, const std::string &path);

} // namespace quasar::snapshot
