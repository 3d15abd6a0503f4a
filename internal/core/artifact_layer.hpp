#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "api/artifact/store/v1.hpp"
#include "internal/document/document_codec.hpp"
#include "internal/lineage/lineage_graph.hpp"
#include "internal/metadata/metadata_index.hpp"
#include "internal/storage/content_store.hpp"

namespace artifact::core {

/*
  What Add() does with a document whose hash is already indexed.

    kSkip     leave the stored artifact alone (idempotent add, default)
    kReject   throw DuplicateError
    kUpsert   replace the index record
*/
enum class DuplicatePolicy {
  kSkip,
  kReject,
  kUpsert,
};

enum class ReadMode {
  kFailFast,     // first unreadable record throws
  kSkipFailures, // unreadable records are logged and skipped
};

struct LayerOptions {
  DuplicatePolicy duplicate_policy = DuplicatePolicy::kSkip;
};

/*
  Lazy reader over a fixed list of hashes.

  The hash list is resolved when the cursor is created; payloads are read
  and decoded one at a time by Next(). Every decoded document is checked
  against its content hash.
*/
class DocumentCursor {
 public:
  DocumentCursor(std::vector<std::string> hashes, storage::ContentStorePtr store, document::DocumentCodecPtr codec, ReadMode mode);

  // false once exhausted
  bool Next(artifact::store::v1::Document* out);

  std::vector<artifact::store::v1::Document> Drain();

  const std::vector<std::string>& Hashes() const {
    return hashes_;
  }

  std::size_t Skipped() const {
    return skipped_;
  }

 private:
  std::vector<std::string>   hashes_;
  storage::ContentStorePtr   store_;
  document::DocumentCodecPtr codec_;
  ReadMode                   mode_;
  std::size_t                pos_     = 0;
  std::size_t                skipped_ = 0;
};

/*
  ArtifactLayer couples a content store and a metadata index.

  Write path (Add):
    begin index transaction
      for each document: payload → store, record → index
    commit (persists the index)

  A payload is always written before its record, so an indexed record never
  points at a missing payload. A failed batch rolls the index back; the
  payloads it already wrote stay behind as orphans until CollectGarbage().
*/
class ArtifactLayer {
 public:
  ArtifactLayer(storage::ContentStorePtr store, metadata::MetadataIndexPtr index, document::DocumentCodecPtr codec, LayerOptions options = {});

  // Every document must carry its content hash (document::Seal).
  void Add(const std::vector<artifact::store::v1::Document>& documents);

  // Order preserving, by logical id.
  std::vector<bool> Exists(const std::vector<std::string>& ids) const;

  DocumentCursor GetMatchingDocuments(const metadata::Selector& selector, ReadMode mode = ReadMode::kFailFast) const;

  // nullopt when the hash is not indexed. Throws when the record exists but
  // its payload is missing or corrupt.
  std::optional<artifact::store::v1::Document> GetDocument(const std::string& hash) const;

  std::vector<artifact::store::v1::Document> GetChildDocuments(const std::string& hash, ReadMode mode = ReadMode::kFailFast) const;

  // Removes matching records; with cascade_payloads also their payloads.
  std::size_t Remove(const metadata::Selector& selector, bool cascade_payloads = false);

  // Deletes payloads no index record refers to. Returns how many.
  std::size_t CollectGarbage();

  std::vector<lineage::LineageEdge> Lineage(const std::string& hash, lineage::Direction direction, uint32_t max_depth = 0) const;

  const storage::ContentStorePtr& Store() const {
    return store_;
  }

  const metadata::MetadataIndexPtr& Index() const {
    return index_;
  }

  const document::DocumentCodecPtr& Codec() const {
    return codec_;
  }

 private:
  void PutPayload(const artifact::store::v1::Document& document);

  storage::ContentStorePtr   store_;
  metadata::MetadataIndexPtr index_;
  document::DocumentCodecPtr codec_;
  LayerOptions               options_;
};

} // namespace artifact::core
