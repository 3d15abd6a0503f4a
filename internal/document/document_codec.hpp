#pragma once

#include <memory>
#include <string>

#include "api/artifact/store/v1.hpp"

namespace artifact::document {

/*
  Serialization collaborator.

  Turns a Document into the opaque payload written to the content store and
  back. The store never looks inside a payload; only the codec does.

  Implementations:
    JSON    → protobuf JSON mapping, human readable payload files
    BINARY  → protobuf wire format, deterministic
*/
class DocumentCodec {
 public:
  virtual ~DocumentCodec() = default;

  virtual std::string Serialize(const artifact::store::v1::Document& document) const = 0;

  // Throws std::runtime_error on malformed input.
  virtual artifact::store::v1::Document Deserialize(const std::string& payload) const = 0;

  virtual std::string Name() const = 0;
};

using DocumentCodecPtr = std::shared_ptr<const DocumentCodec>;

class JsonDocumentCodec final : public DocumentCodec {
 public:
  std::string                   Serialize(const artifact::store::v1::Document& document) const override;
  artifact::store::v1::Document Deserialize(const std::string& payload) const override;
  std::string                   Name() const override {
    return "json";
  }
};

class BinaryDocumentCodec final : public DocumentCodec {
 public:
  std::string                   Serialize(const artifact::store::v1::Document& document) const override;
  artifact::store::v1::Document Deserialize(const std::string& payload) const override;
  std::string                   Name() const override {
    return "binary";
  }
};

} // namespace artifact::document
