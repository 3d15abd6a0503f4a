#pragma once

#include <filesystem>

namespace artifact::util {

/*
  Advisory exclusive lock on a file (flock).

  Held for the lifetime of the object. Serializes load-mutate-save cycles
  across processes sharing one snapshot; in-process callers still need
  their own mutex because flock is per open file description.
*/
class FileLock {
 public:
  explicit FileLock(const std::filesystem::path& path);
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

 private:
  int fd_ = -1;
};

} // namespace artifact::util
