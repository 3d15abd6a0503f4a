#include "caching_interceptor.hpp"

#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/document/document_hash.hpp"
#include "internal/metadata/artifact_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace artifact::core {

using artifact::store::v1::Document;

namespace obs = artifact::observability;

CachingInterceptor::CachingInterceptor(std::shared_ptr<ArtifactLayer> layer) : layer_(std::move(layer)) {
  if (!layer_) {
    throw std::invalid_argument("caching interceptor requires an artifact layer");
  }
}

std::vector<Document> CachingInterceptor::Transform(const std::vector<Document>& documents, DocumentTransformer& transformer) {
  std::vector<std::string> ids;
  ids.reserve(documents.size());
  for (const auto& document : documents) {
    ids.push_back(document.id());
  }

  const auto            known = layer_->Exists(ids);
  const auto            name  = transformer.Name();
  std::vector<Document> out;
  std::size_t           hits  = 0;

  // input hash -> outputs, so a document repeated in one batch is decided once
  std::unordered_map<std::string, std::vector<Document>> decided;

  for (std::size_t i = 0; i < documents.size(); ++i) {
    const auto& input = documents[i];

    auto seen = decided.find(input.hash());
    if (seen != decided.end()) {
      ++hits;
      out.insert(out.end(), seen->second.begin(), seen->second.end());
      continue;
    }

    std::vector<Document> children;
    if (known[i]) {
      children = StoredChildren(input, name);
    }

    if (!children.empty()) {
      ++hits;
    } else {
      children = Compute(input, transformer);
    }

    out.insert(out.end(), children.begin(), children.end());
    decided.emplace(input.hash(), std::move(children));
  }

  ARTIFACT_LOG_DEBUG("Transform pass", {obs::StringField("transformer", name), obs::IntField("inputs", static_cast<int64_t>(documents.size())),
                                        obs::IntField("cache_hits", static_cast<int64_t>(hits))});
  return out;
}

std::vector<Document> CachingInterceptor::StoredChildren(const Document& input, const std::string& transformer_name) const {
  const auto& index = layer_->Index();

  std::vector<Document> children;
  for (const auto& hash : index->Select(metadata::Selector::ByParentHashes({input.hash()}))) {
    const auto artifact = index->Get(hash);
    if (!artifact || metadata::MetadataString(artifact->metadata(), metadata::kTransformerKey) != transformer_name) {
      continue;
    }

    auto document = layer_->GetDocument(hash);
    if (document) {
      children.push_back(std::move(*document));
    }
  }
  return children;
}

std::vector<Document> CachingInterceptor::Compute(const Document& input, DocumentTransformer& transformer) {
  auto outputs = transformer.Transform({input});

  const auto created_at_ms = static_cast<double>(util::ToUnixMillis(util::Now()));
  const auto name          = transformer.Name();

  std::vector<Document>           sealed;
  std::unordered_set<std::string> hashes;
  sealed.reserve(outputs.size());

  for (auto& output : outputs) {
    // parents copied over from the input would point past it
    output.clear_parent_hashes();
    output.add_parent_hashes(input.hash());

    auto& fields = *output.mutable_metadata()->mutable_fields();
    fields[metadata::kTransformerKey].set_string_value(name);
    fields[metadata::kCreatedAtKey].set_number_value(created_at_ms);

    document::Seal(output);

    // identical outputs share a hash and are stored once; return them once
    if (hashes.insert(output.hash()).second) {
      sealed.push_back(std::move(output));
    }
  }
  outputs = std::move(sealed);

  // the input goes first so the outputs' parent resolves inside the batch
  std::vector<Document> batch;
  batch.reserve(outputs.size() + 1);
  if (!layer_->Index()->ExistsByHash({input.hash()}).front()) {
    batch.push_back(input);
  }
  batch.insert(batch.end(), outputs.begin(), outputs.end());

  layer_->Add(batch);
  return outputs;
}

// ------------------------------------------------------------
// CachedTransformer
// ------------------------------------------------------------

CachedTransformer::CachedTransformer(DocumentTransformerPtr inner, std::shared_ptr<CachingInterceptor> interceptor)
    : inner_(std::move(inner)), interceptor_(std::move(interceptor)) {
  if (!inner_ || !interceptor_) {
    throw std::invalid_argument("cached transformer requires a transformer and an interceptor");
  }
}

std::vector<Document> CachedTransformer::Transform(const std::vector<Document>& documents) {
  return interceptor_->Transform(documents, *inner_);
}

// ------------------------------------------------------------
// Pipeline
// ------------------------------------------------------------

Pipeline::Pipeline(std::vector<DocumentTransformerPtr> steps) : steps_(std::move(steps)) {
}

std::shared_ptr<Pipeline> Pipeline::Sequential(const std::vector<DocumentTransformerPtr>& steps, std::shared_ptr<CachingInterceptor> interceptor) {
  std::vector<DocumentTransformerPtr> cached;
  cached.reserve(steps.size());
  for (const auto& step : steps) {
    cached.push_back(std::make_shared<CachedTransformer>(step, interceptor));
  }
  return std::make_shared<Pipeline>(std::move(cached));
}

std::string Pipeline::Name() const {
  std::string name;
  for (const auto& step : steps_) {
    if (!name.empty()) name += ">";
    name += step->Name();
  }
  return name;
}

std::vector<Document> Pipeline::Transform(const std::vector<Document>& documents) {
  std::vector<Document> current = documents;
  for (const auto& step : steps_) {
    current = step->Transform(current);
  }
  return current;
}

} // namespace artifact::core
