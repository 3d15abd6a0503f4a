#include "object_content_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace artifact::storage {

using namespace artifact::storage::common;

ObjectContentStore::ObjectContentStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  if (!root_path_.empty()) {
    Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
  }
}

/*
  Object key layout:

      <root_path>/<hash>
*/
std::string ObjectContentStore::ObjectPath(const std::string& hash) const {
  ValidateHash(hash);
  if (root_path_.empty()) {
    return hash;
  }
  if (root_path_.back() == '/') {
    return root_path_ + hash;
  }
  return root_path_ + "/" + hash;
}

/*
  Upload buffer as object. Object stores are atomic per PUT.
*/
void ObjectContentStore::Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) {
  if (Exists(hash)) {
    EnsureSamePayload(hash, *Get(hash), *payload);
    return;
  }

  auto out = Unwrap(fs_->OpenOutputStream(ObjectPath(hash)));
  Unwrap(out->Write(payload->data(), payload->size()));
  Unwrap(out->Close());
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ObjectContentStore::Get(const std::string& hash) {
  if (!Exists(hash)) {
    throw util::NotFoundError("payload not found: " + hash);
  }

  auto input = Unwrap(fs_->OpenInputFile(ObjectPath(hash)));
  return ReadAll(input);
}

bool ObjectContentStore::Exists(const std::string& hash) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(hash)));
  return info.type() == arrow::fs::FileType::File;
}

void ObjectContentStore::Remove(const std::string& hash) {
  if (!Exists(hash)) {
    return;
  }
  Unwrap(fs_->DeleteFile(ObjectPath(hash)));
}

std::vector<std::string> ObjectContentStore::List() {
  arrow::fs::FileSelector selector;
  selector.base_dir        = root_path_;
  selector.allow_not_found = true;
  selector.recursive       = false;

  std::vector<std::string> hashes;
  for (const auto& info : Unwrap(fs_->GetFileInfo(selector))) {
    if (info.type() != arrow::fs::FileType::File) continue;

    auto name = info.base_name();
    if (IsReservedName(name)) continue;

    hashes.push_back(std::move(name));
  }
  return hashes;
}

} // namespace artifact::storage
