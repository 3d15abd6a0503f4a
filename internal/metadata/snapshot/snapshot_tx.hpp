#pragma once

#include <memory>
#include <mutex>

#include "internal/util/file_lock.hpp"
#include "snapshot_metadata_index.hpp"

namespace artifact::metadata::snapshot {

/*
  Transaction = writer lock + file lock + rollback copy.

  Begin reloads the snapshot from disk (when it exists) so writes apply on
  top of whatever other processes committed. Commit saves.
*/
class SnapshotTransaction final : public IndexTransaction {
 public:
  explicit SnapshotTransaction(SnapshotMetadataIndex& index);
  ~SnapshotTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  SnapshotMetadataIndex&               index_;
  std::unique_lock<std::mutex>         writer_lock_;
  std::unique_ptr<util::FileLock>      file_lock_;
  SnapshotMetadataIndex::State         rollback_state_;
  bool                                 committed_   = false;
  bool                                 rolled_back_ = false;
};

} // namespace artifact::metadata::snapshot
