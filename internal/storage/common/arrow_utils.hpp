#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace artifact::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Atomic replace on a local filesystem:
      write <dir>/.<name>.<random>.tmp → flush → rename

  The temp name is unique per call so concurrent writers of the same target
  never share a temp file.
*/
void AtomicWriteFile(const std::filesystem::path& target, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync);

/*
  Same temp file, but published with a hard link instead of a rename, so an
  existing target is never replaced. Returns false when the target already
  existed; the caller decides what that means.
*/
bool WriteFileIfAbsent(const std::filesystem::path& target, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync);

/*
  Throws IntegrityError when an incoming payload differs from the bytes
  already stored under the same hash.
*/
void EnsureSamePayload(const std::string& hash, const arrow::Buffer& existing, const arrow::Buffer& incoming);

/*
  Resolve an Arrow filesystem from a URI (s3://, gs://, file://) or a plain
  local path. Returns the filesystem and the path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri);

} // namespace artifact::storage::common
