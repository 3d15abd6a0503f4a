#pragma once

#include <memory>
#include <string>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include "internal/storage/content_store.hpp"

namespace artifact::storage {

/*
  Object storage (S3 / GCS / MinIO / local URI) using Arrow filesystem.

  Characteristics:
    - one object per hash, written with a single PUT
    - no fsync semantics
    - existence probes cost a metadata round trip
*/

class ObjectContentStore final : public ContentStore {
 public:
  ObjectContentStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& hash) override;

  bool Exists(const std::string& hash) override;

  void Remove(const std::string& hash) override;

  std::vector<std::string> List() override;

  std::string BackendName() const override {
    return "object:" + fs_->type_name();
  }

 private:
  std::string ObjectPath(const std::string& hash) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace artifact::storage
