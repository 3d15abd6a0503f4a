#include "snapshot_metadata_index.hpp"

#include <arrow/io/file.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "snapshot_tx.hpp"

namespace artifact::metadata::snapshot {

using artifact::store::v1::Artifact;
using artifact::store::v1::MetadataSnapshot;

namespace obs = artifact::observability;

SnapshotMetadataIndex::SnapshotMetadataIndex(std::filesystem::path snapshot_path, IndexOptions options)
    : path_(std::move(snapshot_path)), options_(options) {
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }
  if (std::filesystem::exists(path_)) {
    Load();
  }
}

std::filesystem::path SnapshotMetadataIndex::LockPath() const {
  return path_.parent_path() / ("." + path_.filename().string() + ".lock");
}

std::unique_ptr<IndexTransaction> SnapshotMetadataIndex::Begin() {
  return std::make_unique<SnapshotTransaction>(*this);
}

void SnapshotMetadataIndex::Reindex(State& state) {
  state.by_hash.clear();
  state.by_id.clear();
  for (std::size_t i = 0; i < state.artifacts.size(); ++i) {
    const auto& artifact = state.artifacts[i];
    state.by_hash[artifact.uuid()] = i;
    state.by_id[artifact.custom_id()].push_back(artifact.uuid());
  }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void SnapshotMetadataIndex::Add(const Artifact& artifact, WritePolicy policy) {
  if (artifact.uuid().empty()) {
    throw std::invalid_argument("artifact uuid must not be empty");
  }

  std::unique_lock lock(mutex_);

  if (options_.enforce_provenance) {
    for (const auto& parent : artifact.parent_uuids()) {
      if (!state_.by_hash.contains(parent)) {
        throw util::IntegrityError("artifact " + artifact.uuid() + " references unknown parent " + parent);
      }
    }
  }

  auto it = state_.by_hash.find(artifact.uuid());
  if (it != state_.by_hash.end()) {
    if (policy != WritePolicy::kUpsert) {
      throw util::DuplicateError("artifact already indexed: " + artifact.uuid());
    }
    state_.artifacts[it->second] = artifact;
    Reindex(state_);
    return;
  }

  state_.by_hash.emplace(artifact.uuid(), state_.artifacts.size());
  state_.by_id[artifact.custom_id()].push_back(artifact.uuid());
  state_.artifacts.push_back(artifact);
}

std::size_t SnapshotMetadataIndex::Remove(const Selector& selector) {
  std::unique_lock lock(mutex_);

  std::vector<Artifact> kept;
  kept.reserve(state_.artifacts.size());
  for (auto& artifact : state_.artifacts) {
    if (!Matches(selector, artifact)) {
      kept.push_back(std::move(artifact));
    }
  }

  const std::size_t removed = state_.artifacts.size() - kept.size();
  state_.artifacts          = std::move(kept);
  Reindex(state_);
  return removed;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::vector<bool> SnapshotMetadataIndex::ExistsById(const std::vector<std::string>& ids) const {
  std::shared_lock lock(mutex_);

  std::vector<bool> result;
  result.reserve(ids.size());
  for (const auto& id : ids) {
    result.push_back(state_.by_id.contains(id));
  }
  return result;
}

std::vector<bool> SnapshotMetadataIndex::ExistsByHash(const std::vector<std::string>& hashes) const {
  std::shared_lock lock(mutex_);

  std::vector<bool> result;
  result.reserve(hashes.size());
  for (const auto& hash : hashes) {
    result.push_back(state_.by_hash.contains(hash));
  }
  return result;
}

std::optional<Artifact> SnapshotMetadataIndex::Get(const std::string& hash) const {
  std::shared_lock lock(mutex_);

  auto it = state_.by_hash.find(hash);
  if (it == state_.by_hash.end()) return std::nullopt;

  return state_.artifacts[it->second];
}

std::optional<Artifact> SnapshotMetadataIndex::Latest(const std::string& logical_id) const {
  std::shared_lock lock(mutex_);

  auto it = state_.by_id.find(logical_id);
  if (it == state_.by_id.end() || it->second.empty()) return std::nullopt;

  return state_.artifacts[state_.by_hash.at(it->second.back())];
}

std::vector<std::string> SnapshotMetadataIndex::Select(const Selector& selector) const {
  std::vector<std::string> hashes;
  if (!selector.HasClauses()) {
    return hashes;
  }

  std::shared_lock lock(mutex_);
  for (const auto& artifact : state_.artifacts) {
    if (Matches(selector, artifact)) {
      hashes.push_back(artifact.uuid());
    }
  }
  return hashes;
}

std::vector<Artifact> SnapshotMetadataIndex::List() const {
  std::shared_lock lock(mutex_);
  return state_.artifacts;
}

std::size_t SnapshotMetadataIndex::Size() const {
  std::shared_lock lock(mutex_);
  return state_.artifacts.size();
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

SnapshotMetadataIndex::State SnapshotMetadataIndex::ReadSnapshot() const {
  std::string json;
  try {
    auto file = storage::common::Unwrap(arrow::io::ReadableFile::Open(path_.string()));
    json      = storage::common::ReadAll(file)->ToString();
  } catch (const std::exception& e) {
    throw util::PersistenceError("read snapshot " + path_.string() + ": " + e.what());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  MetadataSnapshot snapshot;
  auto             status = google::protobuf::util::JsonStringToMessage(json, &snapshot, options);
  if (!status.ok()) {
    throw util::PersistenceError("parse snapshot " + path_.string() + ": " + std::string(status.message()));
  }

  State state;
  state.artifacts.reserve(static_cast<std::size_t>(snapshot.artifacts_size()));
  for (auto& artifact : *snapshot.mutable_artifacts()) {
    if (state.by_hash.contains(artifact.uuid())) {
      obs::LogWarn("Dropping duplicate snapshot record", {obs::StringField("uuid", artifact.uuid())});
      continue;
    }
    state.by_hash.emplace(artifact.uuid(), state.artifacts.size());
    state.by_id[artifact.custom_id()].push_back(artifact.uuid());
    state.artifacts.push_back(std::move(artifact));
  }
  return state;
}

void SnapshotMetadataIndex::WriteSnapshot(const State& state) const {
  MetadataSnapshot snapshot;
  snapshot.mutable_artifacts()->Reserve(static_cast<int>(state.artifacts.size()));
  for (const auto& artifact : state.artifacts) {
    *snapshot.add_artifacts() = artifact;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    throw util::PersistenceError("encode snapshot: " + std::string(status.message()));
  }

  try {
    storage::common::AtomicWriteFile(path_, arrow::Buffer::FromString(std::move(json)), /*fsync=*/true);
  } catch (const std::exception& e) {
    throw util::PersistenceError("write snapshot " + path_.string() + ": " + e.what());
  }
}

void SnapshotMetadataIndex::Save() {
  State copy;
  {
    std::shared_lock lock(mutex_);
    copy = state_;
  }
  WriteSnapshot(copy);
  obs::LogDebug("Saved metadata snapshot",
                {obs::StringField("path", path_.string()), obs::IntField("artifacts", static_cast<int64_t>(copy.artifacts.size()))});
}

/*
  A missing snapshot loads as an empty index.
*/
void SnapshotMetadataIndex::Load() {
  State loaded;
  if (std::filesystem::exists(path_)) {
    loaded = ReadSnapshot();
  }

  std::unique_lock lock(mutex_);
  state_ = std::move(loaded);
}

} // namespace artifact::metadata::snapshot
