#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_metadata_index.hpp"
#include "internal/metadata/snapshot/snapshot_metadata_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"

namespace artifact::factory {

using artifact::runtime::config::CodecFormat;
using artifact::runtime::config::ContentStoreConfig;
using artifact::runtime::config::DuplicatePolicy;
using artifact::runtime::config::IndexConfig;
using artifact::runtime::config::RuntimeConfig;

namespace obs = artifact::observability;

namespace {

// Index files sit beside the payloads when the store is on local disk.
std::filesystem::path IndexDirectory(const ContentStoreConfig& store) {
  if (store.has_disk() && !store.disk().root_path().empty()) {
    return store.disk().root_path();
  }
  return storage::StorageFactory::DefaultRoot();
}

metadata::MetadataIndexPtr BuildIndex(const RuntimeConfig& config) {
  const auto& index = config.index();

  metadata::IndexOptions options;
  options.enforce_provenance = index.has_enforce_provenance() ? index.enforce_provenance() : true;

  if (index.has_sqlite()) {
    const auto path = index.sqlite().path().empty() ? IndexDirectory(config.content_store()) / "index.sqlite"
                                                    : std::filesystem::path{index.sqlite().path()};
    const bool wal  = index.sqlite().has_wal_mode() ? index.sqlite().wal_mode() : true;

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string(), wal);
    return std::make_shared<db::sqlite::SqliteMetadataIndex>(std::move(sqlite_db), options);
  }

  const auto path = index.snapshot().path().empty() ? IndexDirectory(config.content_store()) / "metadata.json"
                                                    : std::filesystem::path{index.snapshot().path()};
  return std::make_shared<metadata::snapshot::SnapshotMetadataIndex>(path, options);
}

core::LayerOptions BuildLayerOptions(const IndexConfig& index) {
  core::LayerOptions options;
  switch (index.duplicate_policy()) {
    case artifact::runtime::config::DUPLICATE_POLICY_REJECT:
      options.duplicate_policy = core::DuplicatePolicy::kReject;
      break;
    case artifact::runtime::config::DUPLICATE_POLICY_UPSERT:
      options.duplicate_policy = core::DuplicatePolicy::kUpsert;
      break;
    case artifact::runtime::config::DUPLICATE_POLICY_SKIP:
    default:
      options.duplicate_policy = core::DuplicatePolicy::kSkip;
      break;
  }
  return options;
}

} // namespace

document::DocumentCodecPtr BuildCodec(CodecFormat format) {
  if (format == artifact::runtime::config::CODEC_FORMAT_JSON) {
    return std::make_shared<document::JsonDocumentCodec>();
  }
  return std::make_shared<document::BinaryDocumentCodec>();
}

Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage + index
  // ------------------------------------------------------------------
  runtime.store = storage::StorageFactory::Build(config.content_store());
  runtime.index = BuildIndex(config);
  runtime.codec = BuildCodec(config.codec());

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  runtime.layer       = std::make_shared<core::ArtifactLayer>(runtime.store, runtime.index, runtime.codec, BuildLayerOptions(config.index()));
  runtime.interceptor = std::make_shared<core::CachingInterceptor>(runtime.layer);

  ARTIFACT_LOG_INFO("Artifact store ready", {obs::StringField("store", runtime.store->BackendName()), obs::StringField("codec", runtime.codec->Name()),
                                             obs::IntField("artifacts", static_cast<int64_t>(runtime.index->Size()))});
  return runtime;
}

} // namespace artifact::factory
