#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <vector>

namespace artifact::storage {

/*
  Content-addressed payload storage.

  Every payload is an Arrow Buffer keyed by the content hash of the
  document it encodes. Keys are opaque to the store; it never parses a
  payload.

  Contract for ALL implementations:

    - Put() is idempotent for identical bytes
    - Put() of different bytes under an existing key throws IntegrityError
    - after Put() returns, Get() and Exists() observe the payload
    - Get() of a missing key throws NotFoundError
    - puts of distinct keys are safe to run concurrently

  Implementations:
    DISK     → one file per hash under a root directory
    RAM      → in-memory map, tests and ephemeral pipelines
    OBJECT   → Arrow filesystem (S3 / GCS / local URI)
*/

class ContentStore {
 public:
  virtual ~ContentStore() = default;

  virtual void Put(const std::string& hash, const std::shared_ptr<arrow::Buffer>& payload) = 0;

  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& hash) = 0;

  virtual bool Exists(const std::string& hash) = 0;

  // ------------------------------------------------------------------
  // Garbage collection
  // ------------------------------------------------------------------
  /*
    Remove a payload. Missing keys are not an error.
  */
  virtual void Remove(const std::string& hash) = 0;

  /*
    Every key currently stored, in no particular order.
  */
  virtual std::vector<std::string> List() = 0;

  virtual std::string BackendName() const = 0;
};

using ContentStorePtr = std::shared_ptr<ContentStore>;

} // namespace artifact::storage
