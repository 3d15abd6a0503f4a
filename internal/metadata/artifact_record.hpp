#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "api/artifact/store/v1.hpp"

namespace artifact::metadata {

/*
  Well-known metadata keys stamped by the caching interceptor.

    transformer     name of the step that produced the artifact
    created_at_ms   unix epoch millis at which the artifact was produced
*/
inline constexpr char kTransformerKey[] = "transformer";
inline constexpr char kCreatedAtKey[]   = "created_at_ms";

// Index projection of a document: everything but the content.
artifact::store::v1::Artifact ToArtifact(const artifact::store::v1::Document& document);

/*
  Scalar lookups into free-form metadata.

  MetadataString renders bool as "true"/"false" and integral numbers
  without a fractional part; lists, structs and nulls yield nullopt.
*/
std::optional<std::string> MetadataString(const google::protobuf::Struct& metadata, const std::string& key);
std::optional<int64_t>     MetadataInt(const google::protobuf::Struct& metadata, const std::string& key);

} // namespace artifact::metadata
