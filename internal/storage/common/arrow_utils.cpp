#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace artifact::storage::common {

namespace {

std::filesystem::path WriteTempFile(const std::filesystem::path& target, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  const auto tmp_path = target.parent_path() / ("." + target.filename().string() + "." + util::RandomToken() + ".tmp");

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync)
      Unwrap(out->Flush());

    Unwrap(out->Close());
  } catch (...) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }
  return tmp_path;
}

} // namespace

void AtomicWriteFile(const std::filesystem::path& target, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  const auto tmp_path = WriteTempFile(target, buffer, fsync);

  std::error_code ec;
  std::filesystem::rename(tmp_path, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw std::runtime_error("rename " + tmp_path.string() + " -> " + target.string() + ": " + ec.message());
  }
}

bool WriteFileIfAbsent(const std::filesystem::path& target, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  const auto tmp_path = WriteTempFile(target, buffer, fsync);

  // link(2) never replaces an existing target
  std::error_code ec;
  std::filesystem::create_hard_link(tmp_path, target, ec);

  std::error_code ignored;
  std::filesystem::remove(tmp_path, ignored);

  if (ec == std::errc::file_exists) return false;
  if (ec) {
    throw std::runtime_error("link " + tmp_path.string() + " -> " + target.string() + ": " + ec.message());
  }
  return true;
}

void EnsureSamePayload(const std::string& hash, const arrow::Buffer& existing, const arrow::Buffer& incoming) {
  if (!existing.Equals(incoming)) {
    throw util::IntegrityError("hash collision: payload for " + hash + " differs from stored payload");
  }
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri) {
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace artifact::storage::common
