#pragma once

#include <memory>
#include <mutex>

#include "internal/metadata/metadata_index.hpp"
#include "sqlite_db.hpp"

namespace artifact::db::sqlite {

/*
  Metadata index stored in sqlite.

  Tables:

    artifacts(seq, uuid UNIQUE, custom_id, metadata)   seq orders records
    artifact_parents(uuid, position, parent_uuid)      ordered provenance

  metadata holds the Struct as JSON. Every Add/Remove runs inside a
  SAVEPOINT so a failed call leaves no partial rows, whether or not a
  transaction from Begin() is open.

  Commits are durable on their own; Save() only checkpoints the WAL and
  Load() has nothing to do.
*/
class SqliteMetadataIndex final : public metadata::MetadataIndex {
 public:
  explicit SqliteMetadataIndex(std::shared_ptr<SqliteDB> db, metadata::IndexOptions options = {});

  std::unique_ptr<metadata::IndexTransaction> Begin() override;

  void        Add(const artifact::store::v1::Artifact& artifact, metadata::WritePolicy policy) override;
  std::size_t Remove(const metadata::Selector& selector) override;

  std::vector<bool>                            ExistsById(const std::vector<std::string>& ids) const override;
  std::vector<bool>                            ExistsByHash(const std::vector<std::string>& hashes) const override;
  std::optional<artifact::store::v1::Artifact> Get(const std::string& hash) const override;
  std::optional<artifact::store::v1::Artifact> Latest(const std::string& logical_id) const override;
  std::vector<std::string>                     Select(const metadata::Selector& selector) const override;
  std::vector<artifact::store::v1::Artifact>   List() const override;
  std::size_t                                  Size() const override;

  void Save() override;
  void Load() override;

 private:
  void Migrate();

  bool HasHash(const std::string& hash) const;
  void InsertParents(const artifact::store::v1::Artifact& artifact);

  std::shared_ptr<SqliteDB> db_;
  metadata::IndexOptions    options_;
  std::mutex                writer_mutex_;
};

} // namespace artifact::db::sqlite
