#pragma once

#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/metadata/metadata_index.hpp"

namespace artifact::metadata::snapshot {

class SnapshotTransaction;

/*
  In-memory metadata index persisted as one JSON snapshot.

  Snapshot schema (field names fixed for interoperability):

      { "artifacts": [ { "custom_id": "...", "uuid": "...",
                         "parent_uuids": ["..."], "metadata": {...} } ] }

  The whole record set lives in memory in insertion order, with secondary
  maps hash → position and logical id → hashes. Select() is a full scan.

  Save() writes a temp file and renames it over the snapshot, so a reader
  never sees a partial file. Write transactions additionally hold
  <dir>/.<snapshot name>.lock so that processes sharing the snapshot take
  turns at load-mutate-save.
*/
class SnapshotMetadataIndex final : public MetadataIndex {
 public:
  // Loads the snapshot when it exists; starts empty otherwise.
  explicit SnapshotMetadataIndex(std::filesystem::path snapshot_path, IndexOptions options = {});

  std::unique_ptr<IndexTransaction> Begin() override;

  void        Add(const artifact::store::v1::Artifact& artifact, WritePolicy policy = WritePolicy::kReject) override;
  std::size_t Remove(const Selector& selector) override;

  std::vector<bool>                            ExistsById(const std::vector<std::string>& ids) const override;
  std::vector<bool>                            ExistsByHash(const std::vector<std::string>& hashes) const override;
  std::optional<artifact::store::v1::Artifact> Get(const std::string& hash) const override;
  std::optional<artifact::store::v1::Artifact> Latest(const std::string& logical_id) const override;
  std::vector<std::string>                     Select(const Selector& selector) const override;
  std::vector<artifact::store::v1::Artifact>   List() const override;
  std::size_t                                  Size() const override;

  void Save() override;
  void Load() override;

  const std::filesystem::path& SnapshotPath() const {
    return path_;
  }

  std::filesystem::path LockPath() const;

 private:
  friend class SnapshotTransaction;

  struct State {
    std::vector<artifact::store::v1::Artifact>                artifacts;
    std::unordered_map<std::string, std::size_t>              by_hash;
    std::unordered_map<std::string, std::vector<std::string>> by_id;
  };

  static void Reindex(State& state);

  State ReadSnapshot() const;
  void  WriteSnapshot(const State& state) const;

  std::filesystem::path path_;
  IndexOptions          options_;

  // held by the open SnapshotTransaction
  std::mutex writer_mutex_;

  mutable std::shared_mutex mutex_;
  State                     state_;
};

} // namespace artifact::metadata::snapshot
