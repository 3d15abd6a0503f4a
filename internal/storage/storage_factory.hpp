#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"
#include "content_store.hpp"

namespace artifact::storage {

/*
  Builds the content store backend from configuration.

  Core uses this as:

      auto store = StorageFactory::Build(config.content_store());
      store->Put(hash, buffer);
*/

class StorageFactory {
 public:
  static ContentStorePtr Build(const artifact::runtime::config::ContentStoreConfig& cfg);

  // Root used when no backend is configured.
  static std::filesystem::path DefaultRoot();
};

} // namespace artifact::storage
