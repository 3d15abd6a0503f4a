#include "internal/metadata/snapshot/snapshot_metadata_index.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using artifact::metadata::IndexOptions;
using artifact::metadata::Selector;
using artifact::metadata::WritePolicy;
using artifact::metadata::snapshot::SnapshotMetadataIndex;
using artifact::store::v1::Artifact;

std::filesystem::path FreshSnapshotPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "artifact_store_snapshot_index_tests" / (name + "-" + artifact::util::RandomToken());
  std::filesystem::create_directories(dir);
  return dir / "metadata.json";
}

Artifact MakeArtifact(const std::string& id, const std::string& hash, const std::vector<std::string>& parents = {}) {
  Artifact artifact;
  artifact.set_custom_id(id);
  artifact.set_uuid(hash);
  for (const auto& parent : parents) {
    artifact.add_parent_uuids(parent);
  }
  (*artifact.mutable_metadata()->mutable_fields())["source"].set_string_value(id);
  return artifact;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestExistsPreservesOrder() {
  SnapshotMetadataIndex index(FreshSnapshotPath("exists"));
  index.Add(MakeArtifact("a", "h1"));
  index.Add(MakeArtifact("b", "h2"));

  const auto by_id = index.ExistsById({"b", "zzz", "a", "a"});
  assert((by_id == std::vector<bool>{true, false, true, true}));

  const auto by_hash = index.ExistsByHash({"h9", "h2", "h1"});
  assert((by_hash == std::vector<bool>{false, true, true}));
}

void TestDuplicateHashRejectedUnlessUpsert() {
  SnapshotMetadataIndex index(FreshSnapshotPath("duplicate"));
  index.Add(MakeArtifact("a", "h1"));

  bool threw = false;
  try {
    index.Add(MakeArtifact("a", "h1"));
  } catch (const artifact::util::DuplicateError&) {
    threw = true;
  }
  assert(threw && "Second add of the same hash must be rejected by default.");
  assert(index.Size() == 1);

  auto replacement = MakeArtifact("a-renamed", "h1");
  index.Add(replacement, WritePolicy::kUpsert);
  assert(index.Size() == 1);
  assert(index.Get("h1")->custom_id() == "a-renamed");
  assert((index.ExistsById({"a", "a-renamed"}) == std::vector<bool>{false, true}));
}

void TestProvenanceEnforced() {
  SnapshotMetadataIndex index(FreshSnapshotPath("provenance"));

  bool threw = false;
  try {
    index.Add(MakeArtifact("child", "c1", {"missing"}));
  } catch (const artifact::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(index.Size() == 0);

  index.Add(MakeArtifact("parent", "p1"));
  index.Add(MakeArtifact("child", "c1", {"p1"}));
  assert(index.Size() == 2);

  // dangling provenance after remove is accepted
  assert(index.Remove(Selector::ByHashes({"p1"})) == 1);
  assert(index.Get("c1")->parent_uuids(0) == "p1");

  SnapshotMetadataIndex lax(FreshSnapshotPath("provenance-off"), IndexOptions{false});
  lax.Add(MakeArtifact("orphan", "o1", {"nowhere"}));
  assert(lax.Size() == 1);
}

void TestSelectAndRemove() {
  SnapshotMetadataIndex index(FreshSnapshotPath("select"));
  index.Add(MakeArtifact("doc", "d1"));
  index.Add(MakeArtifact("chunk", "c1", {"d1"}));
  index.Add(MakeArtifact("chunk", "c2", {"d1"}));
  index.Add(MakeArtifact("other", "o1"));

  assert(index.Select(Selector{}).empty());
  assert((index.Select(Selector::ByParentHashes({"d1"})) == std::vector<std::string>{"c1", "c2"}));

  Selector either = Selector::ByIds({"other"});
  either.hashes   = std::unordered_set<std::string>{"d1"};
  assert((index.Select(either) == std::vector<std::string>{"d1", "o1"}));

  assert(index.Remove(Selector::ByIds({"chunk"})) == 2);
  assert(index.Size() == 2);
  assert((index.ExistsByHash({"d1", "c1", "c2", "o1"}) == std::vector<bool>{true, false, false, true}));
  assert(index.Remove(Selector{}) == 0);
}

void TestLatestFollowsInsertionOrder() {
  SnapshotMetadataIndex index(FreshSnapshotPath("latest"));
  index.Add(MakeArtifact("doc", "v1"));
  index.Add(MakeArtifact("doc", "v2"));
  index.Add(MakeArtifact("other", "x"));

  assert(index.Latest("doc")->uuid() == "v2");
  assert(!index.Latest("missing").has_value());

  (void)index.Remove(Selector::ByHashes({"v2"}));
  assert(index.Latest("doc")->uuid() == "v1");
}

void TestSaveLoadRoundTripAndSchema() {
  const auto path = FreshSnapshotPath("roundtrip");
  {
    SnapshotMetadataIndex index(path);
    index.Add(MakeArtifact("doc", "d1"));
    index.Add(MakeArtifact("chunk", "c1", {"d1"}));
    index.Save();
  }

  const auto json = ReadFile(path);
  assert(json.find("\"artifacts\"") != std::string::npos);
  assert(json.find("\"custom_id\"") != std::string::npos);
  assert(json.find("\"parent_uuids\"") != std::string::npos);

  // no temp files left behind
  for (const auto& entry : std::filesystem::directory_iterator(path.parent_path())) {
    assert(entry.path().extension() != ".tmp");
  }

  SnapshotMetadataIndex reloaded(path);
  assert(reloaded.SnapshotPath() == path);
  assert(reloaded.Size() == 2);
  assert(reloaded.Get("c1")->parent_uuids(0) == "d1");
  assert(reloaded.Get("d1")->metadata().fields().at("source").string_value() == "doc");
  assert((reloaded.Select(Selector::ByParentHashes({"d1"})) == std::vector<std::string>{"c1"}));
}

void TestCorruptSnapshotIsPersistenceError() {
  const auto path = FreshSnapshotPath("corrupt");
  std::ofstream(path) << "{ this is not json";

  bool threw = false;
  try {
    SnapshotMetadataIndex index(path);
  } catch (const artifact::util::PersistenceError&) {
    threw = true;
  }
  assert(threw);
}

void TestTransactionCommitAndRollback() {
  const auto            path = FreshSnapshotPath("tx");
  SnapshotMetadataIndex index(path);

  {
    auto tx = index.Begin();
    index.Add(MakeArtifact("kept", "k1"));
    tx->Commit();
    assert(tx->IsCommitted());
  }
  assert(std::filesystem::exists(path));

  {
    auto tx = index.Begin();
    index.Add(MakeArtifact("dropped", "x1"));
    assert(index.Size() == 2);
    // destroyed without commit
  }
  assert(index.Size() == 1);
  assert((index.ExistsByHash({"k1", "x1"}) == std::vector<bool>{true, false}));

  SnapshotMetadataIndex reloaded(path);
  assert(reloaded.Size() == 1);
}

void TestTransactionsSeeOtherInstancesCommits() {
  const auto path = FreshSnapshotPath("shared");

  SnapshotMetadataIndex first(path);
  SnapshotMetadataIndex second(path);

  {
    auto tx = first.Begin();
    first.Add(MakeArtifact("a", "h1"));
    tx->Commit();
  }
  {
    // reloads under the file lock, so h1 survives the second writer's save
    auto tx = second.Begin();
    second.Add(MakeArtifact("b", "h2", {"h1"}));
    tx->Commit();
  }

  SnapshotMetadataIndex reader(path);
  assert((reader.ExistsByHash({"h1", "h2"}) == std::vector<bool>{true, true}));
}

void TestConcurrentWritersSerialize() {
  const auto            path = FreshSnapshotPath("concurrent");
  SnapshotMetadataIndex index(path);

  std::vector<std::thread> writers;
  for (int i = 0; i < 4; ++i) {
    writers.emplace_back([&index, i] {
      for (int j = 0; j < 5; ++j) {
        auto tx = index.Begin();
        index.Add(MakeArtifact("w" + std::to_string(i), "h" + std::to_string(i) + "-" + std::to_string(j)));
        tx->Commit();
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(index.Size() == 20);
  SnapshotMetadataIndex reloaded(path);
  assert(reloaded.Size() == 20);
}

} // namespace

int main() {
  TestExistsPreservesOrder();
  TestDuplicateHashRejectedUnlessUpsert();
  TestProvenanceEnforced();
  TestSelectAndRemove();
  TestLatestFollowsInsertionOrder();
  TestSaveLoadRoundTripAndSchema();
  TestCorruptSnapshotIsPersistenceError();
  TestTransactionCommitAndRollback();
  TestTransactionsSeeOtherInstancesCommits();
  TestConcurrentWritersSerialize();

  std::cout << "artifact_store_unit_snapshot_metadata_index: pass\n";
  return 0;
}
