#include "document_codec.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace artifact::document {

using artifact::store::v1::Document;

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

std::string JsonDocumentCodec::Serialize(const Document& document) const {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize document: " + std::string(status.message()));
  }
  return json;
}

Document JsonDocumentCodec::Deserialize(const std::string& payload) const {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Document document;
  auto     status = google::protobuf::util::JsonStringToMessage(payload, &document, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse document: " + std::string(status.message()));
  }
  return document;
}

// ------------------------------------------------------------
// Binary
// ------------------------------------------------------------

std::string BinaryDocumentCodec::Serialize(const Document& document) const {
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream raw(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!document.SerializeToCodedStream(&coded)) {
      throw std::runtime_error("Failed to serialize document");
    }
  }
  return bytes;
}

Document BinaryDocumentCodec::Deserialize(const std::string& payload) const {
  Document document;
  if (!document.ParseFromString(payload)) {
    throw std::runtime_error("Failed to parse document");
  }
  return document;
}

} // namespace artifact::document
