#pragma once

#include <memory>
#include <string>
#include <vector>

#include "api/artifact/store/v1.hpp"

namespace artifact::core {

/*
  One processing step: documents in, documents out.

  Name() identifies the step in provenance metadata, so two transformers
  that produce different outputs must not share a name. Failures are
  reported by throwing; callers pass them through unchanged.
*/
class DocumentTransformer {
 public:
  virtual ~DocumentTransformer() = default;

  virtual std::string Name() const = 0;

  virtual std::vector<artifact::store::v1::Document> Transform(const std::vector<artifact::store::v1::Document>& documents) = 0;
};

using DocumentTransformerPtr = std::shared_ptr<DocumentTransformer>;

} // namespace artifact::core
