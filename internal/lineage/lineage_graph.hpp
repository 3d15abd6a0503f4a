#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "api/artifact/store/v1.hpp"

namespace artifact::lineage {

enum class Direction {
  kUpstream,   // towards parents
  kDownstream, // towards children
};

struct LineageEdge {
  std::string parent;
  std::string child;
  uint32_t    depth = 0; // 1 for edges touching the start node
};

/*
  Provenance graph over indexed artifacts.

  Built from a point-in-time listing; it does not follow later index
  writes. Parents that are no longer indexed still appear as edge
  endpoints but are not expanded further.
*/
class LineageGraph {
 public:
  LineageGraph() = default;
  explicit LineageGraph(const std::vector<artifact::store::v1::Artifact>& artifacts);

  void Add(const artifact::store::v1::Artifact& artifact);

  bool Contains(const std::string& hash) const;

  /*
    Breadth-first walk from `hash`. Every edge is reported once, nearest
    first. max_depth == 0 means unbounded.
  */
  std::vector<LineageEdge> Query(const std::string& hash, Direction direction, uint32_t max_depth = 0) const;

 private:
  std::unordered_map<std::string, std::vector<std::string>> parents_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
};

} // namespace artifact::lineage
