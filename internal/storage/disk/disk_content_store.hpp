#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/content_store.hpp"

namespace artifact::storage {

/*
  Durable disk storage using Arrow IO.

  Layout:
      <root>/<hash>            one payload file per content hash
      <root>/metadata.json     index snapshot (owned by the metadata layer)

  Properties:
    - atomic replace writes (tmp + rename)
    - optional flush before rename
    - concurrent puts of the same hash converge on identical bytes
*/

class DiskContentStore final : public ContentStore {
 public:
  explicit DiskContentStore(std::filesystem::path root, bool fsync = false);

  void Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& hash) override;

  bool Exists(const std::string& hash) override;

  void Remove(const std::string& hash) override;

  std::vector<std::string> List() override;

  std::string BackendName() const override {
    return "disk";
  }

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace artifact::storage
