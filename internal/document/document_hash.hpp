#pragma once

#include <string>
#include <string_view>

#include "api/artifact/store/v1.hpp"

namespace artifact::document {

/*
  Content hashing.

  The content hash of a document is the lowercase hex BLAKE3-256 digest of
  its deterministic protobuf encoding with the `hash` field cleared. Logical
  id, parents, metadata and content all contribute, so two documents with the
  same hash serialize to the same bytes.
*/

std::string ComputeHash(const artifact::store::v1::Document& document);

// Stamp document.hash with ComputeHash(document).
void Seal(artifact::store::v1::Document& document);

bool VerifyHash(const artifact::store::v1::Document& document);

// Hex BLAKE3 of raw bytes.
std::string HexDigest(std::string_view bytes);

// 64 lowercase hex characters.
bool IsWellFormedHash(std::string_view hash);

} // namespace artifact::document
