#include "internal/core/artifact_layer.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/util/json_util.h>

#include "internal/document/document_hash.hpp"
#include "internal/metadata/snapshot/snapshot_metadata_index.hpp"
#include "internal/storage/disk/disk_content_store.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using artifact::core::ArtifactLayer;
using artifact::core::DuplicatePolicy;
using artifact::core::LayerOptions;
using artifact::core::ReadMode;
using artifact::document::BinaryDocumentCodec;
using artifact::document::JsonDocumentCodec;
using artifact::metadata::Selector;
using artifact::metadata::snapshot::SnapshotMetadataIndex;
using artifact::storage::DiskContentStore;
using artifact::storage::RamContentStore;
using artifact::store::v1::Document;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "artifact_store_layer_tests" / (name + "-" + artifact::util::RandomToken());
  std::filesystem::create_directories(dir);
  return dir;
}

Document MakeDocument(const std::string& id, const std::string& content, const std::vector<std::string>& parents = {}) {
  Document document;
  document.set_id(id);
  document.set_content(content);
  for (const auto& parent : parents) {
    document.add_parent_hashes(parent);
  }
  artifact::document::Seal(document);
  return document;
}

struct Fixture {
  std::filesystem::path                  root;
  std::shared_ptr<DiskContentStore>      store;
  std::shared_ptr<SnapshotMetadataIndex> index;
  std::shared_ptr<ArtifactLayer>         layer;
};

Fixture MakeFixture(const std::string& name, LayerOptions options = {}) {
  Fixture f;
  f.root  = FreshDir(name);
  f.store = std::make_shared<DiskContentStore>(f.root);
  f.index = std::make_shared<SnapshotMetadataIndex>(f.root / "metadata.json");
  f.layer = std::make_shared<ArtifactLayer>(f.store, f.index, std::make_shared<BinaryDocumentCodec>(), options);
  return f;
}

void TestAddThenReadBack() {
  auto f   = MakeFixture("roundtrip");
  auto doc = MakeDocument("report", "hello world");
  (*doc.mutable_metadata()->mutable_fields())["lang"].set_string_value("en");
  artifact::document::Seal(doc);

  f.layer->Add({doc});

  assert(f.layer->Store() == f.store);
  assert(f.layer->Codec()->Name() == "binary");
  assert(f.store->Exists(doc.hash()));
  assert(std::filesystem::exists(f.root / "metadata.json"));

  const auto read = f.layer->GetMatchingDocuments(Selector::ByHashes({doc.hash()})).Drain();
  assert(read.size() == 1);
  assert(read[0].SerializeAsString() == doc.SerializeAsString());
  assert(read[0].metadata().fields().at("lang").string_value() == "en");

  assert(f.layer->GetDocument(doc.hash())->content() == "hello world");
  assert(!f.layer->GetDocument(std::string(64, '0')).has_value());
}

void TestIdempotentAdd() {
  auto f   = MakeFixture("idempotent");
  auto doc = MakeDocument("report", "same bytes");

  f.layer->Add({doc});
  f.layer->Add({doc, doc});

  assert(f.index->Size() == 1);
  assert(f.store->List().size() == 1);
}

void TestRejectPolicy() {
  auto f   = MakeFixture("reject", LayerOptions{DuplicatePolicy::kReject});
  auto doc = MakeDocument("report", "bytes");
  f.layer->Add({doc});

  bool threw = false;
  try {
    f.layer->Add({doc});
  } catch (const artifact::util::DuplicateError&) {
    threw = true;
  }
  assert(threw);
  assert(f.index->Size() == 1);
}

void TestExistsPreservesOrder() {
  auto f = MakeFixture("exists");
  f.layer->Add({MakeDocument("a", "1"), MakeDocument("b", "2")});

  const auto exists = f.layer->Exists({"b", "missing", "a"});
  assert((exists == std::vector<bool>{true, false, true}));
}

void TestStaleHashRejectedBeforeWrite() {
  auto f   = MakeFixture("stale");
  auto doc = MakeDocument("report", "original");
  doc.set_content("edited after sealing");

  bool threw = false;
  try {
    f.layer->Add({doc});
  } catch (const artifact::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(f.index->Size() == 0);
  assert(f.store->List().empty());
}

void TestProvenanceInsideOneBatch() {
  auto f      = MakeFixture("provenance");
  auto parent = MakeDocument("doc", "full text");
  auto child  = MakeDocument("doc#0", "full", {parent.hash()});

  f.layer->Add({parent, child});

  const auto children = f.layer->GetChildDocuments(parent.hash());
  assert(children.size() == 1);
  assert(children[0].hash() == child.hash());

  // parent in a later batch is too late
  auto f2    = MakeFixture("provenance-missing");
  bool threw = false;
  try {
    f2.layer->Add({child});
  } catch (const artifact::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(f2.index->Size() == 0);
}

void TestFailedBatchLeavesOrphansForGc() {
  auto f    = MakeFixture("orphans");
  auto good = MakeDocument("good", "first");
  auto bad  = MakeDocument("bad", "second", {std::string(64, 'f')});

  bool threw = false;
  try {
    f.layer->Add({good, bad});
  } catch (const artifact::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);

  // index rolled back; both payloads were already written
  assert(f.index->Size() == 0);
  assert(f.store->Exists(good.hash()));
  assert(f.store->Exists(bad.hash()));

  SnapshotMetadataIndex reloaded(f.root / "metadata.json");
  assert(reloaded.Size() == 0);

  assert(f.layer->CollectGarbage() == 2);
  assert(f.store->List().empty());
}

void TestRemoveIsolation() {
  auto f  = MakeFixture("remove");
  auto d1 = MakeDocument("keep", "1");
  auto d2 = MakeDocument("drop", "2");
  f.layer->Add({d1, d2});

  assert(f.layer->Remove(Selector::ByIds({"drop"})) == 1);
  assert((f.layer->Exists({"keep", "drop"}) == std::vector<bool>{true, false}));

  // records only: the payload stays until gc
  assert(f.store->Exists(d2.hash()));
  assert(f.layer->GetDocument(d1.hash()).has_value());

  assert(f.layer->CollectGarbage() == 1);
  assert(f.store->Exists(d1.hash()));
  assert(!f.store->Exists(d2.hash()));

  assert(f.layer->Remove(Selector::ByIds({"keep"}), /*cascade_payloads=*/true) == 1);
  assert(!f.store->Exists(d1.hash()));
}

void TestCorruptPayloadReadModes() {
  auto f  = MakeFixture("corrupt");
  auto d1 = MakeDocument("a", "one");
  auto d2 = MakeDocument("b", "two");
  auto d3 = MakeDocument("c", "three");
  f.layer->Add({d1, d2, d3});

  // d2 goes missing, d3 is overwritten with garbage
  f.store->Remove(d2.hash());
  std::filesystem::remove(f.root / d3.hash());
  f.store->Put(d3.hash(), arrow::Buffer::FromString("garbage"));

  Selector all = Selector::ByIds({"a", "b", "c"});

  auto skipping = f.layer->GetMatchingDocuments(all, ReadMode::kSkipFailures);
  assert(skipping.Hashes().size() == 3);
  auto read     = skipping.Drain();
  assert(read.size() == 1);
  assert(read[0].hash() == d1.hash());
  assert(skipping.Skipped() == 2);

  auto failing = f.layer->GetMatchingDocuments(all, ReadMode::kFailFast);
  Document   first;
  const bool has_first = failing.Next(&first);
  assert(has_first && first.hash() == d1.hash());
  bool threw = false;
  try {
    Document next;
    (void)failing.Next(&next);
  } catch (const artifact::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void TestEquivalentPayloadEncodingIsAccepted() {
  auto store = std::make_shared<RamContentStore>();
  auto root  = FreshDir("equivalent-encoding");
  auto doc   = MakeDocument("report", "bytes");
  (*doc.mutable_metadata()->mutable_fields())["b"].set_string_value("2");
  (*doc.mutable_metadata()->mutable_fields())["a"].set_string_value("1");
  artifact::document::Seal(doc);

  // payload present but never indexed, encoded with different whitespace
  google::protobuf::util::JsonPrintOptions pretty;
  pretty.add_whitespace              = true;
  pretty.preserve_proto_field_names = true;
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(doc, &json, pretty);
  assert(status.ok());
  store->Put(doc.hash(), arrow::Buffer::FromString(json));

  auto index = std::make_shared<SnapshotMetadataIndex>(root / "metadata.json");
  auto layer = std::make_shared<ArtifactLayer>(store, index, std::make_shared<JsonDocumentCodec>());
  layer->Add({doc});
  assert(index->Size() == 1);
  assert(layer->GetDocument(doc.hash())->content() == "bytes");

  // a different document squatting on a hash is a collision
  auto other = MakeDocument("other", "other bytes");
  store->Put(other.hash(), arrow::Buffer::FromString(JsonDocumentCodec().Serialize(doc)));

  bool threw = false;
  try {
    layer->Add({other});
  } catch (const artifact::util::IntegrityError&) {
    threw = true;
  }
  assert(threw);
  assert(!index->ExistsByHash({other.hash()}).front());
}

void TestLineage() {
  auto f    = MakeFixture("lineage");
  auto root = MakeDocument("doc", "root");
  auto mid  = MakeDocument("doc#0", "mid", {root.hash()});
  auto leaf = MakeDocument("doc#0#0", "leaf", {mid.hash()});
  f.layer->Add({root, mid, leaf});

  const auto up = f.layer->Lineage(leaf.hash(), artifact::lineage::Direction::kUpstream);
  assert(up.size() == 2);
  assert(up[0].child == leaf.hash() && up[0].parent == mid.hash());
  assert(up[1].parent == root.hash() && up[1].depth == 2);

  const auto down = f.layer->Lineage(root.hash(), artifact::lineage::Direction::kDownstream, 1);
  assert(down.size() == 1 && down[0].child == mid.hash());

  bool threw = false;
  try {
    (void)f.layer->Lineage(std::string(64, '0'), artifact::lineage::Direction::kUpstream);
  } catch (const artifact::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAddThenReadBack();
  TestIdempotentAdd();
  TestRejectPolicy();
  TestExistsPreservesOrder();
  TestStaleHashRejectedBeforeWrite();
  TestProvenanceInsideOneBatch();
  TestFailedBatchLeavesOrphansForGc();
  TestRemoveIsolation();
  TestCorruptPayloadReadModes();
  TestEquivalentPayloadEncodingIsAccepted();
  TestLineage();

  std::cout << "artifact_store_unit_artifact_layer: pass\n";
  return 0;
}
