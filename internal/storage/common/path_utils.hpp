#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace artifact::storage::common {

/*
  Content hashes become file and object names, so they must be a single
  path component. Names containing '.' are reserved for the snapshot, lock
  and temp files that share the root.
*/
inline void ValidateHash(const std::string& hash) {
  if (hash.empty()) {
    throw std::invalid_argument("content hash must not be empty");
  }
  for (char c : hash) {
    if (c == '/' || c == '\\' || c == '\0' || c == '.') {
      throw std::invalid_argument("content hash contains invalid character");
    }
  }
}

inline bool IsReservedName(const std::string& name) {
  return name.find('.') != std::string::npos;
}

inline std::filesystem::path PayloadPath(const std::filesystem::path& root, const std::string& hash) {
  ValidateHash(hash);
  return root / hash;
}

} // namespace artifact::storage::common
