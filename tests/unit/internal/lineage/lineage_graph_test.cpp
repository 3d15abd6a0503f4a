#include "internal/lineage/lineage_graph.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using artifact::lineage::Direction;
using artifact::lineage::LineageEdge;
using artifact::lineage::LineageGraph;
using artifact::store::v1::Artifact;

Artifact MakeArtifact(const std::string& hash, const std::vector<std::string>& parents = {}) {
  Artifact artifact;
  artifact.set_custom_id(hash);
  artifact.set_uuid(hash);
  for (const auto& parent : parents) {
    artifact.add_parent_uuids(parent);
  }
  return artifact;
}

bool ContainsEdge(const std::vector<LineageEdge>& edges, const std::string& parent, const std::string& child) {
  return std::any_of(edges.begin(), edges.end(), [&](const LineageEdge& edge) { return edge.parent == parent && edge.child == child; });
}

void TestUpstreamTraversalRespectsMaxDepth() {
  LineageGraph graph({MakeArtifact("A"), MakeArtifact("B", {"A"}), MakeArtifact("C", {"B"})});

  const auto all_upstream = graph.Query("C", Direction::kUpstream, 0);
  assert(all_upstream.size() == 2);
  assert(ContainsEdge(all_upstream, "B", "C"));
  assert(ContainsEdge(all_upstream, "A", "B"));

  const auto shallow = graph.Query("C", Direction::kUpstream, 1);
  assert(shallow.size() == 1);
  assert(shallow[0].parent == "B" && shallow[0].depth == 1);
}

void TestDownstreamFansOut() {
  LineageGraph graph({MakeArtifact("doc"), MakeArtifact("c1", {"doc"}), MakeArtifact("c2", {"doc"}), MakeArtifact("e1", {"c1"})});

  const auto down = graph.Query("doc", Direction::kDownstream);
  assert(down.size() == 3);
  assert(down[0].child == "c1" && down[1].child == "c2");
  assert(down[2].parent == "c1" && down[2].child == "e1" && down[2].depth == 2);
}

void TestDiamondVisitsNodesOnce() {
  LineageGraph graph;
  graph.Add(MakeArtifact("root"));
  graph.Add(MakeArtifact("left", {"root"}));
  graph.Add(MakeArtifact("right", {"root"}));
  graph.Add(MakeArtifact("merge", {"left", "right"}));

  const auto up = graph.Query("merge", Direction::kUpstream);
  // both edges into root are reported, root is expanded once
  assert(up.size() == 4);
  assert(ContainsEdge(up, "root", "left"));
  assert(ContainsEdge(up, "root", "right"));
}

void TestDanglingParentIsAnEndpoint() {
  LineageGraph graph({MakeArtifact("child", {"removed"})});

  assert(graph.Contains("child"));
  assert(!graph.Contains("removed"));

  const auto up = graph.Query("child", Direction::kUpstream);
  assert(up.size() == 1 && up[0].parent == "removed");
}

} // namespace

int main() {
  TestUpstreamTraversalRespectsMaxDepth();
  TestDownstreamFansOut();
  TestDiamondVisitsNodesOnce();
  TestDanglingParentIsAnEndpoint();

  std::cout << "artifact_store_unit_lineage_graph: pass\n";
  return 0;
}
