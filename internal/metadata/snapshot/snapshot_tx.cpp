#include "snapshot_tx.hpp"

#include <filesystem>
#include <stdexcept>

namespace artifact::metadata::snapshot {

SnapshotTransaction::SnapshotTransaction(SnapshotMetadataIndex& index) : index_(index), writer_lock_(index.writer_mutex_) {
  file_lock_ = std::make_unique<util::FileLock>(index_.LockPath());

  if (std::filesystem::exists(index_.path_)) {
    index_.Load();
  }

  std::shared_lock lock(index_.mutex_);
  rollback_state_ = index_.state_; // snapshot copy
}

SnapshotTransaction::~SnapshotTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void SnapshotTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("snapshot transaction already finished");
  }
  index_.Save();
  committed_ = true;
}

void SnapshotTransaction::Rollback() {
  if (committed_ || rolled_back_) return;

  std::unique_lock lock(index_.mutex_);
  index_.state_ = std::move(rollback_state_);
  rolled_back_  = true;
}

} // namespace artifact::metadata::snapshot
