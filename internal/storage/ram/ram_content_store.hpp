#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <arrow/buffer.h>

#include "internal/storage/content_store.hpp"

namespace artifact::storage {

/*
  RAM content store.

  Backed by Arrow buffers stored in-memory. Reads are zero-copy.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamContentStore final : public ContentStore {
 public:
  RamContentStore()           = default;
  ~RamContentStore() override = default;

  void Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) override;

  std::shared_ptr<arrow::Buffer> Get(const std::string& hash) override;

  bool Exists(const std::string& hash) override;

  void Remove(const std::string& hash) override;

  std::vector<std::string> List() override;

  std::string BackendName() const override {
    return "ram";
  }

 private:
  mutable std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace artifact::storage
