#include "artifact_layer.hpp"

#include <stdexcept>
#include <utility>

#include "internal/document/document_hash.hpp"
#include "internal/metadata/artifact_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace artifact::core {

using artifact::store::v1::Document;

namespace obs = artifact::observability;

namespace {

Document LoadDocument(storage::ContentStore& store, const document::DocumentCodec& codec, const std::string& hash) {
  const auto payload  = store.Get(hash);
  Document   document = codec.Deserialize(payload->ToString());

  if (document.hash() != hash || !document::VerifyHash(document)) {
    throw util::IntegrityError("payload " + hash + " does not match its content hash");
  }
  return document;
}

// Same hash, different bytes: acceptable only when the stored payload
// decodes to the same document (e.g. a different codec wrote it).
bool StoredPayloadMatches(storage::ContentStore& store, const document::DocumentCodec& codec, const std::string& hash) {
  try {
    LoadDocument(store, codec, hash);
    return true;
  } catch (const std::exception& e) {
    obs::LogWarn("Stored payload failed verification", {obs::StringField("hash", hash), obs::StringField("error", e.what())});
    return false;
  }
}

} // namespace

// ------------------------------------------------------------
// DocumentCursor
// ------------------------------------------------------------

DocumentCursor::DocumentCursor(std::vector<std::string> hashes, storage::ContentStorePtr store, document::DocumentCodecPtr codec, ReadMode mode)
    : hashes_(std::move(hashes)), store_(std::move(store)), codec_(std::move(codec)), mode_(mode) {
}

bool DocumentCursor::Next(Document* out) {
  while (pos_ < hashes_.size()) {
    const auto& hash = hashes_[pos_++];
    try {
      *out = LoadDocument(*store_, *codec_, hash);
      return true;
    } catch (const std::exception& e) {
      if (mode_ == ReadMode::kFailFast) throw;

      ++skipped_;
      ARTIFACT_LOG_WARN("Skipping unreadable artifact", {obs::StringField("hash", hash), obs::StringField("error", e.what())});
    }
  }
  return false;
}

std::vector<Document> DocumentCursor::Drain() {
  std::vector<Document> documents;
  documents.reserve(hashes_.size() - pos_);

  Document document;
  while (Next(&document)) {
    documents.push_back(std::move(document));
  }
  return documents;
}

// ------------------------------------------------------------
// ArtifactLayer
// ------------------------------------------------------------

ArtifactLayer::ArtifactLayer(storage::ContentStorePtr store, metadata::MetadataIndexPtr index, document::DocumentCodecPtr codec,
                             LayerOptions options)
    : store_(std::move(store)), index_(std::move(index)), codec_(std::move(codec)), options_(options) {
  if (!store_ || !index_ || !codec_) {
    throw std::invalid_argument("artifact layer requires a content store, an index and a codec");
  }
}

void ArtifactLayer::PutPayload(const Document& document) {
  auto payload = arrow::Buffer::FromString(codec_->Serialize(document));
  try {
    store_->Put(document.hash(), payload);
  } catch (const util::IntegrityError&) {
    if (!StoredPayloadMatches(*store_, *codec_, document.hash())) throw;
  }
}

void ArtifactLayer::Add(const std::vector<Document>& documents) {
  if (documents.empty()) return;

  for (const auto& document : documents) {
    if (!document::VerifyHash(document)) {
      throw util::IntegrityError("document " + document.id() + " carries a stale or missing content hash");
    }
  }

  const auto policy = options_.duplicate_policy == DuplicatePolicy::kUpsert ? metadata::WritePolicy::kUpsert : metadata::WritePolicy::kReject;

  auto        tx      = index_->Begin();
  std::size_t added   = 0;
  std::size_t skipped = 0;

  for (const auto& document : documents) {
    if (options_.duplicate_policy == DuplicatePolicy::kSkip && index_->ExistsByHash({document.hash()}).front()) {
      ++skipped;
      continue;
    }

    PutPayload(document);
    index_->Add(metadata::ToArtifact(document), policy);
    ++added;
  }

  tx->Commit();

  ARTIFACT_LOG_DEBUG("Added artifacts", {obs::IntField("added", static_cast<int64_t>(added)), obs::IntField("skipped", static_cast<int64_t>(skipped))});
}

std::vector<bool> ArtifactLayer::Exists(const std::vector<std::string>& ids) const {
  return index_->ExistsById(ids);
}

DocumentCursor ArtifactLayer::GetMatchingDocuments(const metadata::Selector& selector, ReadMode mode) const {
  return DocumentCursor(index_->Select(selector), store_, codec_, mode);
}

std::optional<Document> ArtifactLayer::GetDocument(const std::string& hash) const {
  if (!index_->ExistsByHash({hash}).front()) {
    return std::nullopt;
  }
  return LoadDocument(*store_, *codec_, hash);
}

std::vector<Document> ArtifactLayer::GetChildDocuments(const std::string& hash, ReadMode mode) const {
  return GetMatchingDocuments(metadata::Selector::ByParentHashes({hash}), mode).Drain();
}

std::size_t ArtifactLayer::Remove(const metadata::Selector& selector, bool cascade_payloads) {
  auto tx = index_->Begin();

  const auto  hashes  = index_->Select(selector);
  std::size_t removed = index_->Remove(selector);
  tx->Commit();

  if (cascade_payloads) {
    for (const auto& hash : hashes) {
      store_->Remove(hash);
    }
  }

  ARTIFACT_LOG_INFO("Removed artifacts", {obs::IntField("records", static_cast<int64_t>(removed)), obs::BoolField("cascade", cascade_payloads)});
  return removed;
}

/*
  Runs inside an index transaction so that no Add() can interleave
  between the listing and the deletes.
*/
std::size_t ArtifactLayer::CollectGarbage() {
  auto tx = index_->Begin();

  const auto keys    = store_->List();
  const auto indexed = index_->ExistsByHash(keys);

  std::size_t collected = 0;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (indexed[i]) continue;

    store_->Remove(keys[i]);
    ++collected;
  }

  tx->Rollback();

  ARTIFACT_LOG_INFO("Collected orphan payloads", {obs::IntField("payloads", static_cast<int64_t>(collected)), obs::StringField("backend", store_->BackendName())});
  return collected;
}

std::vector<lineage::LineageEdge> ArtifactLayer::Lineage(const std::string& hash, lineage::Direction direction, uint32_t max_depth) const {
  const lineage::LineageGraph graph(index_->List());
  if (!graph.Contains(hash)) {
    throw util::NotFoundError("artifact not indexed: " + hash);
  }
  return graph.Query(hash, direction, max_depth);
}

} // namespace artifact::core
