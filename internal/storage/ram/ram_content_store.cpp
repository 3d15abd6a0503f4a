#include "ram_content_store.hpp"

#include <mutex>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace artifact::storage {

void RamContentStore::Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) {
  common::ValidateHash(hash);

  std::unique_lock lock(mutex_);

  auto it = buffers_.find(hash);
  if (it != buffers_.end()) {
    common::EnsureSamePayload(hash, *it->second, *payload);
    return;
  }

  buffers_.emplace(hash, payload);
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamContentStore::Get(const std::string& hash) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(hash);
  if (it == buffers_.end()) throw util::NotFoundError("payload not found: " + hash);

  return it->second;
}

bool RamContentStore::Exists(const std::string& hash) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(hash);
}

void RamContentStore::Remove(const std::string& hash) {
  std::unique_lock lock(mutex_);
  buffers_.erase(hash);
}

std::vector<std::string> RamContentStore::List() {
  std::shared_lock lock(mutex_);

  std::vector<std::string> hashes;
  hashes.reserve(buffers_.size());
  for (const auto& [hash, _] : buffers_) {
    hashes.push_back(hash);
  }
  return hashes;
}

} // namespace artifact::storage
