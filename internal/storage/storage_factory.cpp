#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "disk/disk_content_store.hpp"
#include "object/object_content_store.hpp"
#include "ram/ram_content_store.hpp"

namespace artifact::storage {

std::filesystem::path StorageFactory::DefaultRoot() {
  return std::filesystem::path{"data/artifacts"};
}

ContentStorePtr StorageFactory::Build(const artifact::runtime::config::ContentStoreConfig& cfg) {
  using artifact::runtime::config::ContentStoreConfig;

  switch (cfg.backend_case()) {
    case ContentStoreConfig::kRam:
      return std::make_shared<RamContentStore>();

    case ContentStoreConfig::kObject: {
      auto [object_fs, object_root] = common::Unwrap(common::ResolveFileSystem(cfg.object().uri()));
      return std::make_shared<ObjectContentStore>(std::move(object_fs), std::move(object_root));
    }

    case ContentStoreConfig::kDisk: {
      std::filesystem::path root = cfg.disk().root_path().empty() ? DefaultRoot() : std::filesystem::path{cfg.disk().root_path()};
      return std::make_shared<DiskContentStore>(std::move(root), cfg.disk().fsync());
    }

    case ContentStoreConfig::BACKEND_NOT_SET:
    default:
      return std::make_shared<DiskContentStore>(DefaultRoot());
  }
}

} // namespace artifact::storage
