#include "disk_content_store.hpp"

#include <arrow/io/file.h>

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace artifact::storage {

using namespace artifact::storage::common;

DiskContentStore::DiskContentStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

/*
  Existing payloads are compared byte for byte; identical bytes make the
  put a no-op. A concurrent put that publishes first wins and this one is
  compared against it.
*/
void DiskContentStore::Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) {
  auto final_path = PayloadPath(root_, hash);

  if (std::filesystem::exists(final_path) || !WriteFileIfAbsent(final_path, payload, fsync_)) {
    EnsureSamePayload(hash, *Get(hash), *payload);
  }
}

/*
  Read entire payload from disk.
*/
std::shared_ptr<arrow::Buffer> DiskContentStore::Get(const std::string& hash) {
  auto path = PayloadPath(root_, hash);

  if (!std::filesystem::exists(path)) {
    throw util::NotFoundError("payload not found: " + hash);
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

bool DiskContentStore::Exists(const std::string& hash) {
  return std::filesystem::is_regular_file(PayloadPath(root_, hash));
}

/*
  Remove payload from disk
*/
void DiskContentStore::Remove(const std::string& hash) {
  std::error_code ec;
  std::filesystem::remove(PayloadPath(root_, hash), ec);
  if (ec) {
    throw std::runtime_error("remove payload " + hash + ": " + ec.message());
  }
}

std::vector<std::string> DiskContentStore::List() {
  std::vector<std::string> hashes;
  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (!entry.is_regular_file()) continue;

    auto name = entry.path().filename().string();
    if (IsReservedName(name)) continue;

    hashes.push_back(std::move(name));
  }
  return hashes;
}

} // namespace artifact::storage
