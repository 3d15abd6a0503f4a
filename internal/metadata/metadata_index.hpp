#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/artifact/store/v1.hpp"
#include "internal/metadata/selector.hpp"

namespace artifact::metadata {

/*
  Policy when Add() meets a hash that is already indexed.

    kReject   throw DuplicateError (default)
    kUpsert   replace the record in place; opt-in because it rewrites
              provenance under an existing content hash
*/
enum class WritePolicy {
  kReject,
  kUpsert,
};

struct IndexOptions {
  // Reject records whose parent_uuids are not indexed (IntegrityError).
  bool enforce_provenance = true;
};

/*
  Exclusive write scope over an index.

  Semantics guaranteed for ALL backends:

  - only one IndexTransaction is open per index at a time (single writer)
  - Commit() persists every mutation made since Begin()
  - Rollback() discards them
  - Destructor MUST rollback if not committed

  Snapshot: process mutex + flock, reload on begin, save on commit
  SQLite:   BEGIN IMMEDIATE / COMMIT
*/
class IndexTransaction {
 public:
  virtual ~IndexTransaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

/*
  Metadata index over stored artifacts.

  Reads observe a consistent snapshot taken under the index lock. Result
  vectors are in insertion order; existence checks preserve input order.
*/
class MetadataIndex {
 public:
  virtual ~MetadataIndex() = default;

  virtual std::unique_ptr<IndexTransaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  // Throws DuplicateError (kReject on an indexed hash) or IntegrityError
  // (missing parent while provenance is enforced).
  virtual void Add(const artifact::store::v1::Artifact& artifact, WritePolicy policy = WritePolicy::kReject) = 0;

  // Deletes matching records only. Payloads are not touched.
  virtual std::size_t Remove(const Selector& selector) = 0;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::vector<bool> ExistsById(const std::vector<std::string>& ids) const = 0;

  virtual std::vector<bool> ExistsByHash(const std::vector<std::string>& hashes) const = 0;

  virtual std::optional<artifact::store::v1::Artifact> Get(const std::string& hash) const = 0;

  // Most recently added artifact carrying this logical id.
  virtual std::optional<artifact::store::v1::Artifact> Latest(const std::string& logical_id) const = 0;

  virtual std::vector<std::string> Select(const Selector& selector) const = 0;

  virtual std::vector<artifact::store::v1::Artifact> List() const = 0;

  virtual std::size_t Size() const = 0;

  // ---------------------------------------------------------------------
  // Persistence
  // ---------------------------------------------------------------------

  // Atomic: a concurrent Load() sees either the previous or the new state.
  virtual void Save() = 0;

  virtual void Load() = 0;
};

using MetadataIndexPtr = std::shared_ptr<MetadataIndex>;

} // namespace artifact::metadata
