#pragma once

#include <memory>
#include <string>
#include <vector>

#include "artifact_layer.hpp"
#include "transformer.hpp"

namespace artifact::core {

/*
  Makes a transformer skip-on-repeat.

  For each input document:

    hit   the logical id is stored AND the index holds children of this
          exact input hash produced by a transformer of the same name:
          the stored children are returned, the transformer is not run
    miss  the transformer runs on the single document; its outputs get
          the input hash as their only parent plus transformer /
          created_at_ms metadata, are resealed, and are persisted together
          with the input (when not stored yet) in one ArtifactLayer::Add.
          Outputs that seal to the same hash are returned once.

  An input repeated within one call is decided once and its outputs are
  repeated. Outputs keep input order and each input's outputs stay
  contiguous.
  Transformer exceptions propagate as thrown. An input whose transformer
  produced nothing is recomputed on every pass.
*/
class CachingInterceptor {
 public:
  explicit CachingInterceptor(std::shared_ptr<ArtifactLayer> layer);

  std::vector<artifact::store::v1::Document> Transform(const std::vector<artifact::store::v1::Document>& documents,
                                                       DocumentTransformer&                              transformer);

  const std::shared_ptr<ArtifactLayer>& Layer() const {
    return layer_;
  }

 private:
  std::vector<artifact::store::v1::Document> StoredChildren(const artifact::store::v1::Document& input, const std::string& transformer_name) const;

  std::vector<artifact::store::v1::Document> Compute(const artifact::store::v1::Document& input, DocumentTransformer& transformer);

  std::shared_ptr<ArtifactLayer> layer_;
};

/*
  A transformer whose every call goes through a CachingInterceptor.
*/
class CachedTransformer final : public DocumentTransformer {
 public:
  CachedTransformer(DocumentTransformerPtr inner, std::shared_ptr<CachingInterceptor> interceptor);

  std::string Name() const override {
    return inner_->Name();
  }

  std::vector<artifact::store::v1::Document> Transform(const std::vector<artifact::store::v1::Document>& documents) override;

 private:
  DocumentTransformerPtr              inner_;
  std::shared_ptr<CachingInterceptor> interceptor_;
};

/*
  Steps applied in order, each one fed the previous step's outputs.

      Pipeline::Sequential({parser, splitter}, interceptor)

  caches every step on its own, so a later run that changes only the
  splitter reuses the parser's stored outputs.
*/
class Pipeline final : public DocumentTransformer {
 public:
  explicit Pipeline(std::vector<DocumentTransformerPtr> steps);

  static std::shared_ptr<Pipeline> Sequential(const std::vector<DocumentTransformerPtr>& steps, std::shared_ptr<CachingInterceptor> interceptor);

  std::string Name() const override;

  std::vector<artifact::store::v1::Document> Transform(const std::vector<artifact::store::v1::Document>& documents) override;

 private:
  std::vector<DocumentTransformerPtr> steps_;
};

} // namespace artifact::core
