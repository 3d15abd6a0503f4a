#include "sqlite_metadata_index.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace artifact::db::sqlite {

using artifact::store::v1::Artifact;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

void StepDone(sqlite3* db, sqlite3_stmt* st, const std::string& what) {
  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) ThrowIfError(db, rc, what);
}

std::string EncodeMetadata(const google::protobuf::Struct& metadata) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json);
  if (!status.ok()) {
    throw util::PersistenceError("encode metadata: " + std::string(status.message()));
  }
  return json;
}

void DecodeMetadata(const std::string& json, google::protobuf::Struct* metadata) {
  auto status = google::protobuf::util::JsonStringToMessage(json, metadata);
  if (!status.ok()) {
    throw util::PersistenceError("decode metadata: " + std::string(status.message()));
  }
}

/*
  Nested, named sqlite transaction. Released on Release(); rolled back
  to its start otherwise.
*/
class Savepoint {
 public:
  Savepoint(SqliteDB& db, std::string name) : db_(db), name_(std::move(name)) {
    db_.Exec("SAVEPOINT " + name_ + ";");
  }

  ~Savepoint() {
    if (released_) return;
    try {
      db_.Exec("ROLLBACK TO " + name_ + ";");
      db_.Exec("RELEASE " + name_ + ";");
    } catch (const std::exception& e) {
      ARTIFACT_LOG_WARN("sqlite savepoint rollback failed", {observability::StringField("savepoint", name_), observability::StringField("error", e.what())});
    }
  }

  void Release() {
    db_.Exec("RELEASE " + name_ + ";");
    released_ = true;
  }

 private:
  SqliteDB&   db_;
  std::string name_;
  bool        released_ = false;
};

constexpr char kSelectArtifacts[] = "SELECT uuid, custom_id, metadata FROM artifacts";

} // namespace

SqliteMetadataIndex::SqliteMetadataIndex(std::shared_ptr<SqliteDB> db, metadata::IndexOptions options)
    : db_(std::move(db)), options_(options) {
  Migrate();
}

void SqliteMetadataIndex::Migrate() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS artifacts("
      "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  uuid TEXT NOT NULL UNIQUE,"
      "  custom_id TEXT NOT NULL,"
      "  metadata TEXT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS artifacts_custom_id ON artifacts(custom_id, seq);"
      "CREATE TABLE IF NOT EXISTS artifact_parents("
      "  uuid TEXT NOT NULL,"
      "  position INTEGER NOT NULL,"
      "  parent_uuid TEXT NOT NULL,"
      "  PRIMARY KEY(uuid, position));"
      "CREATE INDEX IF NOT EXISTS artifact_parents_parent ON artifact_parents(parent_uuid);");
}

std::unique_ptr<metadata::IndexTransaction> SqliteMetadataIndex::Begin() {
  return std::make_unique<SqliteTransaction>(db_, writer_mutex_);
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

bool SqliteMetadataIndex::HasHash(const std::string& hash) const {
  auto st = db_->Prepare("SELECT 1 FROM artifacts WHERE uuid=?;");
  BindText(st.get(), 1, hash);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return true;
  ThrowIfError(db_->Handle(), rc, "lookup artifact");
  return false;
}

void SqliteMetadataIndex::InsertParents(const Artifact& artifact) {
  auto st = db_->Prepare("INSERT INTO artifact_parents(uuid, position, parent_uuid) VALUES(?,?,?);");
  for (int i = 0; i < artifact.parent_uuids_size(); ++i) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, artifact.uuid());
    sqlite3_bind_int(st.get(), 2, i);
    BindText(st.get(), 3, artifact.parent_uuids(i));
    StepDone(db_->Handle(), st.get(), "insert parent");
  }
}

void SqliteMetadataIndex::Add(const Artifact& artifact, metadata::WritePolicy policy) {
  if (artifact.uuid().empty()) {
    throw std::invalid_argument("artifact uuid must not be empty");
  }

  Savepoint sp(*db_, "artifact_add");

  if (options_.enforce_provenance) {
    for (const auto& parent : artifact.parent_uuids()) {
      if (!HasHash(parent)) {
        throw util::IntegrityError("artifact " + artifact.uuid() + " references unknown parent " + parent);
      }
    }
  }

  const std::string metadata_json = EncodeMetadata(artifact.metadata());

  if (HasHash(artifact.uuid())) {
    if (policy != metadata::WritePolicy::kUpsert) {
      throw util::DuplicateError("artifact already indexed: " + artifact.uuid());
    }

    // in place: seq and therefore insertion order are kept
    auto update = db_->Prepare("UPDATE artifacts SET custom_id=?, metadata=? WHERE uuid=?;");
    BindText(update.get(), 1, artifact.custom_id());
    BindText(update.get(), 2, metadata_json);
    BindText(update.get(), 3, artifact.uuid());
    StepDone(db_->Handle(), update.get(), "update artifact");

    auto clear = db_->Prepare("DELETE FROM artifact_parents WHERE uuid=?;");
    BindText(clear.get(), 1, artifact.uuid());
    StepDone(db_->Handle(), clear.get(), "clear parents");
  } else {
    auto insert = db_->Prepare("INSERT INTO artifacts(uuid, custom_id, metadata) VALUES(?,?,?);");
    BindText(insert.get(), 1, artifact.uuid());
    BindText(insert.get(), 2, artifact.custom_id());
    BindText(insert.get(), 3, metadata_json);
    StepDone(db_->Handle(), insert.get(), "insert artifact");
  }

  InsertParents(artifact);
  sp.Release();
}

std::size_t SqliteMetadataIndex::Remove(const metadata::Selector& selector) {
  const auto hashes = Select(selector);
  if (hashes.empty()) return 0;

  Savepoint sp(*db_, "artifact_remove");

  auto del_artifact = db_->Prepare("DELETE FROM artifacts WHERE uuid=?;");
  auto del_parents  = db_->Prepare("DELETE FROM artifact_parents WHERE uuid=?;");
  for (const auto& hash : hashes) {
    sqlite3_reset(del_artifact.get());
    BindText(del_artifact.get(), 1, hash);
    StepDone(db_->Handle(), del_artifact.get(), "delete artifact");

    sqlite3_reset(del_parents.get());
    BindText(del_parents.get(), 1, hash);
    StepDone(db_->Handle(), del_parents.get(), "delete parents");
  }

  sp.Release();
  return hashes.size();
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::vector<bool> SqliteMetadataIndex::ExistsById(const std::vector<std::string>& ids) const {
  std::vector<bool> result;
  result.reserve(ids.size());

  auto st = db_->Prepare("SELECT 1 FROM artifacts WHERE custom_id=? LIMIT 1;");
  for (const auto& id : ids) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) ThrowIfError(db_->Handle(), rc, "exists by id");
    result.push_back(rc == SQLITE_ROW);
  }
  return result;
}

std::vector<bool> SqliteMetadataIndex::ExistsByHash(const std::vector<std::string>& hashes) const {
  std::vector<bool> result;
  result.reserve(hashes.size());
  for (const auto& hash : hashes) {
    result.push_back(HasHash(hash));
  }
  return result;
}

std::optional<Artifact> SqliteMetadataIndex::Get(const std::string& hash) const {
  auto st = db_->Prepare(std::string(kSelectArtifacts) + " WHERE uuid=?;");
  BindText(st.get(), 1, hash);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfError(db_->Handle(), rc, "get artifact");
    return std::nullopt;
  }

  Artifact artifact;
  artifact.set_uuid(ColText(st.get(), 0));
  artifact.set_custom_id(ColText(st.get(), 1));
  DecodeMetadata(ColText(st.get(), 2), artifact.mutable_metadata());

  auto parents = db_->Prepare("SELECT parent_uuid FROM artifact_parents WHERE uuid=? ORDER BY position;");
  BindText(parents.get(), 1, hash);
  while ((rc = sqlite3_step(parents.get())) == SQLITE_ROW) {
    artifact.add_parent_uuids(ColText(parents.get(), 0));
  }
  ThrowIfError(db_->Handle(), rc, "get parents");

  return artifact;
}

std::optional<Artifact> SqliteMetadataIndex::Latest(const std::string& logical_id) const {
  auto st = db_->Prepare("SELECT uuid FROM artifacts WHERE custom_id=? ORDER BY seq DESC LIMIT 1;");
  BindText(st.get(), 1, logical_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfError(db_->Handle(), rc, "latest artifact");
    return std::nullopt;
  }
  return Get(ColText(st.get(), 0));
}

std::vector<std::string> SqliteMetadataIndex::Select(const metadata::Selector& selector) const {
  std::vector<std::string> hashes;
  if (!selector.HasClauses()) {
    return hashes;
  }

  for (const auto& artifact : List()) {
    if (metadata::Matches(selector, artifact)) {
      hashes.push_back(artifact.uuid());
    }
  }
  return hashes;
}

std::vector<Artifact> SqliteMetadataIndex::List() const {
  std::unordered_map<std::string, std::vector<std::string>> parents_by_uuid;
  {
    auto st = db_->Prepare("SELECT uuid, parent_uuid FROM artifact_parents ORDER BY uuid, position;");
    int  rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      parents_by_uuid[ColText(st.get(), 0)].push_back(ColText(st.get(), 1));
    }
    ThrowIfError(db_->Handle(), rc, "list parents");
  }

  std::vector<Artifact> artifacts;
  auto                  st = db_->Prepare(std::string(kSelectArtifacts) + " ORDER BY seq;");
  int                   rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    Artifact artifact;
    artifact.set_uuid(ColText(st.get(), 0));
    artifact.set_custom_id(ColText(st.get(), 1));
    DecodeMetadata(ColText(st.get(), 2), artifact.mutable_metadata());

    auto it = parents_by_uuid.find(artifact.uuid());
    if (it != parents_by_uuid.end()) {
      for (auto& parent : it->second) {
        artifact.add_parent_uuids(std::move(parent));
      }
    }
    artifacts.push_back(std::move(artifact));
  }
  ThrowIfError(db_->Handle(), rc, "list artifacts");
  return artifacts;
}

std::size_t SqliteMetadataIndex::Size() const {
  auto st = db_->Prepare("SELECT COUNT(*) FROM artifacts;");
  int  rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfError(db_->Handle(), rc, "count artifacts");
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

void SqliteMetadataIndex::Save() {
  // a checkpoint cannot run inside the open write transaction; its commit
  // is already durable
  if (!db_->WalMode() || !sqlite3_get_autocommit(db_->Handle())) return;

  db_->Exec("PRAGMA wal_checkpoint(PASSIVE);");
}

void SqliteMetadataIndex::Load() {
  ARTIFACT_LOG_DEBUG("sqlite index reads through; nothing to load", {observability::StringField("path", db_->Path())});
}

} // namespace artifact::db::sqlite
