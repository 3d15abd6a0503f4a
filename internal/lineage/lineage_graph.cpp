#include "lineage_graph.hpp"

#include <queue>
#include <unordered_set>
#include <utility>

namespace artifact::lineage {

LineageGraph::LineageGraph(const std::vector<artifact::store::v1::Artifact>& artifacts) {
  for (const auto& artifact : artifacts) {
    Add(artifact);
  }
}

void LineageGraph::Add(const artifact::store::v1::Artifact& artifact) {
  auto& parents = parents_[artifact.uuid()];
  for (const auto& parent : artifact.parent_uuids()) {
    parents.push_back(parent);
    children_[parent].push_back(artifact.uuid());
  }
}

bool LineageGraph::Contains(const std::string& hash) const {
  return parents_.contains(hash);
}

std::vector<LineageEdge> LineageGraph::Query(const std::string& hash, Direction direction, uint32_t max_depth) const {
  std::vector<LineageEdge> edges;

  const auto& adjacency = direction == Direction::kUpstream ? parents_ : children_;

  std::queue<std::pair<std::string, uint32_t>> q;
  std::unordered_set<std::string>              visited;

  q.emplace(hash, 0);
  visited.insert(hash);

  while (!q.empty()) {
    const auto [node, depth] = q.front();
    q.pop();

    if (max_depth && depth >= max_depth) {
      continue;
    }

    auto it = adjacency.find(node);
    if (it == adjacency.end()) {
      continue;
    }

    for (const auto& next : it->second) {
      LineageEdge edge;
      edge.parent = direction == Direction::kUpstream ? next : node;
      edge.child  = direction == Direction::kUpstream ? node : next;
      edge.depth  = depth + 1;
      edges.push_back(std::move(edge));

      if (visited.insert(next).second) {
        q.emplace(next, depth + 1);
      }
    }
  }

  return edges;
}

} // namespace artifact::lineage
