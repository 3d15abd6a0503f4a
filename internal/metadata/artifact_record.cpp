#include "artifact_record.hpp"

#include <cmath>
#include <sstream>

namespace artifact::metadata {

using artifact::store::v1::Artifact;
using artifact::store::v1::Document;

Artifact ToArtifact(const Document& document) {
  Artifact record;
  record.set_custom_id(document.id());
  record.set_uuid(document.hash());
  record.mutable_parent_uuids()->CopyFrom(document.parent_hashes());
  *record.mutable_metadata() = document.metadata();
  return record;
}

std::optional<std::string> MetadataString(const google::protobuf::Struct& metadata, const std::string& key) {
  auto it = metadata.fields().find(key);
  if (it == metadata.fields().end()) {
    return std::nullopt;
  }

  const auto& value = it->second;
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return std::string(value.bool_value() ? "true" : "false");
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::trunc(number) == number && std::abs(number) < 9.0e15) {
        return std::to_string(static_cast<int64_t>(number));
      }
      std::ostringstream out;
      out << number;
      return out.str();
    }
    default:
      return std::nullopt;
  }
}

std::optional<int64_t> MetadataInt(const google::protobuf::Struct& metadata, const std::string& key) {
  auto it = metadata.fields().find(key);
  if (it == metadata.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  const double number = it->second.number_value();
  // [-2^63, 2^63) is the range a cast to int64_t is defined for
  if (!std::isfinite(number) || number < -9223372036854775808.0 || number >= 9223372036854775808.0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(number);
}

} // namespace artifact::metadata
